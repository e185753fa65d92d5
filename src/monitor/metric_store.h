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

// This file contains the sample log of one run. Samples are kept in memory
// per (metric, instance), ordered and deduplicated by timestamp, and every
// newly accepted sample is appended to one TSV file per metric:
//   <run_dir>/<MetricName>.tsv  with rows  instance \t value \t timestamp
// Rows are never rewritten. Any I/O failure throws PersistenceError.
#ifndef METRIC_STORE_H
#define METRIC_STORE_H

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "metric_types.h"

namespace idlereaper {
namespace internal {

class MetricStore {
public:
  // metrics: the tracked metric set; files are named after metric.name.
  // default_watermark: watermark of instances never seen before, usually
  // loop start minus a safety margin.
  MetricStore(const std::string& run_dir,
              const std::vector<MetricSpec>& metrics,
              int64_t default_watermark);

  // Create the run directory and reload rows written earlier for this run.
  void Recover();

  // Merge samples into the log of (metric, instance) and append the ones
  // not seen before to the metric file. Return the number of new samples.
  size_t Append(const MetricName& metric, const std::string& instance,
                const std::vector<Sample>& samples);

  int64_t Watermark(const std::string& instance) const;

  // Monotonic: earlier timestamps are ignored.
  void AdvanceWatermark(const std::string& instance, int64_t timestamp);

  // The last n values of (metric, instance) in timestamp order; fewer if
  // the log is shorter.
  std::vector<double> RecentValues(const MetricName& metric,
                                   const std::string& instance,
                                   size_t n) const;

  size_t NumSamples(const MetricName& metric,
                    const std::string& instance) const;

  // Drop in-memory state of an instance that left the fleet. Files are kept.
  void Forget(const std::string& instance);

  std::string MetricPath(const MetricName& metric) const;
  const std::string& run_dir() const { return run_dir_; }

  // "<run_id>_<YYYY-MM-DD>"
  static std::string RunDirName(const std::string& run_id, int64_t timestamp);

private:
  typedef std::map<int64_t, double> SampleLog;  // timestamp -> value

  void RecoverFile(const MetricName& metric,
                   std::map<std::string, int64_t>* latest);

  const std::string run_dir_;
  const int64_t default_watermark_;
  std::map<std::string, std::string> paths_;  // metric key -> file path

  mutable std::mutex mutex_;  // Protects the maps below and the files.
  std::map<std::string, std::map<std::string, SampleLog>> logs_;
  std::map<std::string, int64_t> watermarks_;
};

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef METRIC_STORE_H
