/*
 * Copyright 2018-2021 Board of Trustees of Stanford University
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

// Defaults shared by the idlereaper daemon, its tests and the CLI tools.
#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <cstdint>
#include <string>

// AWS
static const std::string default_region = "us-west-2";
static const std::string default_cluster_tag_key = "cluster";

// CloudWatch returns at most 1440 datapoints per request. Windows are paged
// in chunks of datapoints_per_request periods to stay below that limit.
static const int32_t max_datapoints_per_request = 1440;
static const int32_t datapoints_per_request = 1152;
static const int32_t default_period_s = 300;
static const std::string default_statistic = "Average";
static const std::string instance_dimension = "InstanceId";

// Idle detection. The threshold is percent utilization (0-100).
static const std::string idle_metric_namespace = "AWS/EC2";
static const std::string idle_metric_name = "CPUUtilization";
static const std::string idle_metric_unit = "Percent";
static const int16_t default_idle_window = 3;  // 3 x 5 min = 15 min
static const double default_idle_threshold = 0.5;

// Loop pacing, all in seconds.
static const int32_t default_warmup_s = 900;
static const int32_t default_interval_s = 3600;
static const int32_t default_lookahead_s = 300;
static const int32_t default_watermark_margin_s = 1800;

// Transient backend errors: 30s, 40s, 50s, ... up to the attempt budget.
static const int16_t default_retry_attempts = 4;
static const int32_t default_retry_initial_s = 30;
static const int32_t default_retry_step_s = 10;

static const int16_t default_fetch_workers = 4;

// Watchdog alarm
static const std::string default_alarm_prefix = "idlereaper";
static const double default_alarm_threshold = 0.5;
static const double default_leader_alarm_threshold = 5.0;
static const int16_t default_alarm_periods = 3;

// Output
static const std::string default_output_root = ".";
static const std::string metric_file_suffix = ".tsv";
static const std::string run_summary_file = "summary.txt";

// Control service
static const std::string default_control_address = "0.0.0.0:50061";
static const std::string default_control_target = "localhost:50061";

#endif  // #ifndef CONSTANTS_H
