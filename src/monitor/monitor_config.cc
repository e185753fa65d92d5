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

#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "include/constants.h"
#include "monitor_config.h"

using json = nlohmann::json;

namespace idlereaper {
namespace internal {
namespace {

MetricSpec make_spec(const std::string& ns, const std::string& name,
                     const std::string& unit) {
  MetricSpec spec;
  spec.metric.ns = ns;
  spec.metric.name = name;
  spec.unit = unit;
  spec.statistic = default_statistic;
  spec.period_s = default_period_s;
  return spec;
}

// Integer settings are read wide and range-checked, so an out-of-range
// value is rejected instead of wrapping.
template <typename T>
T read_int(const json& j, const char* key, T fallback) {
  const int64_t value = j.value(key, static_cast<int64_t>(fallback));
  if (value < std::numeric_limits<T>::min() ||
      value > std::numeric_limits<T>::max()) {
    throw std::invalid_argument(std::string("\"") + key +
                                "\" out of range: " + std::to_string(value));
  }
  return static_cast<T>(value);
}

MetricSpec parse_metric(const json& entry) {
  if (!entry.is_object()) {
    throw std::invalid_argument("Metric entries must be objects");
  }
  MetricSpec spec = make_spec(entry.at("namespace").get<std::string>(),
                              entry.at("name").get<std::string>(),
                              entry.at("unit").get<std::string>());
  spec.statistic = entry.value("statistic", spec.statistic);
  spec.period_s = read_int(entry, "period_s", spec.period_s);
  return spec;
}

}  // namespace

MonitorConfig DefaultMonitorConfig() {
  MonitorConfig config;
  config.region = default_region;
  config.cluster_tag_key = default_cluster_tag_key;

  config.metrics.push_back(make_spec("AWS/EC2", "CPUUtilization", "Percent"));
  config.metrics.push_back(make_spec("CGCloud", "MemUsage", "Percent"));
  config.metrics.push_back(
      make_spec("CGCloud", "DiskUsage_mnt_ephemeral", "Percent"));
  config.metrics.push_back(make_spec("CGCloud", "DiskUsage_root", "Percent"));
  config.metrics.push_back(make_spec("AWS/EC2", "NetworkIn", "Bytes"));
  config.metrics.push_back(make_spec("AWS/EC2", "NetworkOut", "Bytes"));
  config.metrics.push_back(make_spec("AWS/EC2", "DiskWriteOps", "Count"));
  config.metrics.push_back(make_spec("AWS/EC2", "DiskReadOps", "Count"));

  config.idle_metric.ns = idle_metric_namespace;
  config.idle_metric.name = idle_metric_name;
  config.idle_window = default_idle_window;
  config.idle_threshold = default_idle_threshold;

  config.warmup_s = default_warmup_s;
  config.interval_s = default_interval_s;
  config.lookahead_s = default_lookahead_s;
  config.watermark_margin_s = default_watermark_margin_s;

  config.retry.max_attempts = default_retry_attempts;
  config.retry.initial_delay_s = default_retry_initial_s;
  config.retry.step_s = default_retry_step_s;
  config.fetch_workers = default_fetch_workers;

  config.output_root = default_output_root;

  config.alarm.enabled = false;
  config.alarm.threshold = default_alarm_threshold;
  config.alarm.evaluation_periods = default_alarm_periods;
  config.alarm.prefix = default_alarm_prefix;

  config.control_address = default_control_address;
  return config;
}

MonitorConfig ParseMonitorConfig(const std::string& json_text) {
  MonitorConfig config = DefaultMonitorConfig();
  try {
    json j = json::parse(json_text);
    if (!j.is_object()) {
      throw std::invalid_argument("Configuration must be a JSON object");
    }

    config.region = j.value("region", config.region);
    config.cluster = j.value("cluster", config.cluster);
    config.cluster_tag_key = j.value("cluster_tag_key", config.cluster_tag_key);
    config.worker_name = j.value("worker_name", config.worker_name);

    if (j.count("metrics")) {
      const json& metrics = j.at("metrics");
      if (!metrics.is_array()) {
        throw std::invalid_argument("\"metrics\" must be an array");
      }
      config.metrics.clear();
      for (const json& entry : metrics) {
        config.metrics.push_back(parse_metric(entry));
      }
    }

    if (j.count("idle")) {
      const json& idle = j.at("idle");
      config.idle_metric.ns = idle.value("namespace", config.idle_metric.ns);
      config.idle_metric.name = idle.value("name", config.idle_metric.name);
      config.idle_window = read_int(idle, "window", config.idle_window);
      config.idle_threshold = idle.value("threshold", config.idle_threshold);
    }

    config.warmup_s = read_int(j, "warmup_s", config.warmup_s);
    config.interval_s = read_int(j, "interval_s", config.interval_s);
    config.lookahead_s = read_int(j, "lookahead_s", config.lookahead_s);
    config.watermark_margin_s =
        read_int(j, "watermark_margin_s", config.watermark_margin_s);

    if (j.count("retry")) {
      const json& retry = j.at("retry");
      config.retry.max_attempts =
          read_int(retry, "max_attempts", config.retry.max_attempts);
      config.retry.initial_delay_s =
          read_int(retry, "initial_delay_s", config.retry.initial_delay_s);
      config.retry.step_s = read_int(retry, "step_s", config.retry.step_s);
    }
    config.fetch_workers =
        read_int(j, "fetch_workers", config.fetch_workers);

    config.output_root = j.value("output_root", config.output_root);
    config.run_id = j.value("run_id", config.run_id);

    if (j.count("archive")) {
      const json& archive = j.at("archive");
      config.archive_bucket = archive.value("bucket", config.archive_bucket);
      config.archive_prefix = archive.value("prefix", config.archive_prefix);
    }

    if (j.count("alarm")) {
      const json& alarm = j.at("alarm");
      config.alarm.enabled = alarm.value("enabled", config.alarm.enabled);
      config.alarm.threshold = alarm.value("threshold", config.alarm.threshold);
      config.alarm.evaluation_periods = read_int(
          alarm, "evaluation_periods", config.alarm.evaluation_periods);
      config.alarm.action = alarm.value("action", config.alarm.action);
      config.alarm.prefix = alarm.value("prefix", config.alarm.prefix);
    }

    config.control_address = j.value("control_address", config.control_address);
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("Bad configuration: ") + e.what());
  }
  return config;
}

MonitorConfig LoadMonitorConfig(const std::string& path) {
  std::ifstream infile(path);
  if (!infile.is_open()) {
    throw std::invalid_argument("Cannot open configuration file " + path);
  }
  std::stringstream buffer;
  buffer << infile.rdbuf();
  return ParseMonitorConfig(buffer.str());
}

void ValidateMonitorConfig(const MonitorConfig& config) {
  if (config.cluster.empty()) {
    throw std::invalid_argument("No cluster given");
  }
  if (config.region.empty()) { throw std::invalid_argument("No region given"); }
  if (config.metrics.empty()) {
    throw std::invalid_argument("No metrics to track");
  }

  // Files are named after the metric name, so names must be unique.
  std::set<std::string> names;
  for (const MetricSpec& spec : config.metrics) {
    if (spec.metric.ns.empty() || spec.metric.name.empty()) {
      throw std::invalid_argument("Metric with empty namespace or name");
    }
    if (spec.unit.empty()) {
      throw std::invalid_argument("Metric " + spec.metric.Key() +
                                  " has no unit");
    }
    if (spec.period_s <= 0 || spec.period_s % 60 != 0) {
      throw std::invalid_argument("Metric " + spec.metric.Key() +
                                  " needs a period that is a multiple of 60");
    }
    if (!names.insert(spec.metric.name).second) {
      throw std::invalid_argument("Duplicate metric name " + spec.metric.name);
    }
  }

  const MetricSpec* idle = FindMetric(config, config.idle_metric);
  if (idle == NULL) {
    throw std::invalid_argument("Idle metric " + config.idle_metric.Key() +
                                " is not tracked");
  }
  if (idle->unit != idle_metric_unit) {
    throw std::invalid_argument("Idle metric " + config.idle_metric.Key() +
                                " must be measured in " + idle_metric_unit);
  }
  if (config.idle_window < 1) {
    throw std::invalid_argument("Idle window must be at least 1");
  }
  if (config.idle_threshold < 0.0 || config.idle_threshold > 100.0) {
    throw std::invalid_argument("Idle threshold must be within [0, 100]");
  }

  if (config.warmup_s < 0 || config.lookahead_s < 0 ||
      config.watermark_margin_s < 0) {
    throw std::invalid_argument("Durations must not be negative");
  }
  if (config.interval_s < 1) {
    throw std::invalid_argument("Interval must be at least 1 second");
  }
  if (config.retry.max_attempts < 1 || config.retry.initial_delay_s < 0 ||
      config.retry.step_s < 0) {
    throw std::invalid_argument("Invalid retry policy");
  }
  if (config.fetch_workers < 1) {
    throw std::invalid_argument("Need at least one fetch worker");
  }
  if (config.output_root.empty()) {
    throw std::invalid_argument("No output root given");
  }
  if (config.alarm.enabled && config.alarm.evaluation_periods < 1) {
    throw std::invalid_argument("Alarm needs at least one evaluation period");
  }
}

const MetricSpec* FindMetric(const MonitorConfig& config,
                             const MetricName& metric) {
  for (const MetricSpec& spec : config.metrics) {
    if (spec.metric == metric) { return &spec; }
  }
  return NULL;
}

}  // namespace internal
}  // namespace idlereaper
