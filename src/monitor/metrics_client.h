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

// This file contains the telemetry backend interface and the client the
// monitor loop uses on top of it. The client pages long windows and retries
// transient failures with a bounded linear backoff.
#ifndef METRICS_CLIENT_H
#define METRICS_CLIENT_H

#include <cstdint>
#include <string>
#include <vector>

#include "cancellable_sleeper.h"
#include "metric_types.h"

namespace idlereaper {
namespace internal {

// One request against the telemetry backend (CloudWatch
// GetMetricStatistics). start is inclusive, end is exclusive.
// On failure, error describes the cause.
class MetricsBackend {
public:
  virtual ~MetricsBackend() {}

  virtual FetchStatus FetchMetricStatistics(const MetricSpec& spec,
                                            const std::string& instance,
                                            int64_t start, int64_t end,
                                            std::vector<Sample>* samples,
                                            std::string* error) = 0;
};

struct RetryPolicy {
  int16_t max_attempts;     // total attempts per window, at least 1
  int32_t initial_delay_s;  // delay after the first failure
  int32_t step_s;           // added to the delay after each further failure
};

class MetricsClient {
public:
  // backend and sleeper are not owned and must outlive the client.
  MetricsClient(MetricsBackend* backend, const RetryPolicy& policy,
                CancellableSleeper* sleeper);

  // Fetch all samples of spec for instance in [start, end), sorted by
  // timestamp. Windows longer than datapoints_per_request periods are split
  // into consecutive requests. Either every request succeeds or no samples
  // are returned.
  // On failure, reason holds a one-line explanation for the cycle log.
  FetchStatus Fetch(const MetricSpec& spec, const std::string& instance,
                    int64_t start, int64_t end, std::vector<Sample>* samples,
                    std::string* reason);

  // Delay before retry number `retry` (1-based).
  int32_t BackoffSeconds(int16_t retry) const;

private:
  FetchStatus FetchWindow(const MetricSpec& spec, const std::string& instance,
                          int64_t start, int64_t end,
                          std::vector<Sample>* samples, std::string* reason);

  MetricsBackend* backend_;
  RetryPolicy policy_;
  CancellableSleeper* sleeper_;
};

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef METRICS_CLIENT_H
