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

// This file contains the configuration of one monitor run. It is read from
// a JSON file (see conf/idlereaper.json) and then selectively overridden on
// the command line. Defaults come from include/constants.h.
#ifndef MONITOR_CONFIG_H
#define MONITOR_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

#include "metric_types.h"
#include "metrics_client.h"

namespace idlereaper {
namespace internal {

struct AlarmConfig {
  bool enabled;
  double threshold;  // percent
  int16_t evaluation_periods;
  std::string action;  // empty means terminate, see TerminateActionArn
  std::string prefix;
};

struct MonitorConfig {
  // Fleet
  std::string region;
  std::string cluster;
  std::string cluster_tag_key;
  std::string worker_name;  // optional Name tag filter

  // Telemetry
  std::vector<MetricSpec> metrics;
  MetricName idle_metric;
  int16_t idle_window;
  double idle_threshold;  // percent, 0-100

  // Pacing, in seconds
  int32_t warmup_s;
  int32_t interval_s;
  int32_t lookahead_s;
  int32_t watermark_margin_s;

  RetryPolicy retry;
  int16_t fetch_workers;

  // Output
  std::string output_root;
  std::string run_id;  // empty means a random UUID
  std::string archive_bucket;  // empty disables the S3 archive
  std::string archive_prefix;

  AlarmConfig alarm;

  std::string control_address;  // empty disables the control service
};

// The built-in defaults, tracking the usual EC2 and CGCloud metrics.
MonitorConfig DefaultMonitorConfig();

// Parse a JSON document on top of the defaults.
// Throws std::invalid_argument on malformed input.
MonitorConfig ParseMonitorConfig(const std::string& json_text);

// Read and parse a JSON file. Throws std::invalid_argument.
MonitorConfig LoadMonitorConfig(const std::string& path);

// Check cross-field constraints. Throws std::invalid_argument.
void ValidateMonitorConfig(const MonitorConfig& config);

// The MetricSpec of a tracked metric, or NULL.
const MetricSpec* FindMetric(const MonitorConfig& config,
                             const MetricName& metric);

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef MONITOR_CONFIG_H
