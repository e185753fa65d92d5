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

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "include/constants.h"
#include "metrics_client.h"

namespace idlereaper {
namespace internal {

MetricsClient::MetricsClient(MetricsBackend* backend, const RetryPolicy& policy,
                             CancellableSleeper* sleeper)
    : backend_(backend), policy_(policy), sleeper_(sleeper) {
  if (policy_.max_attempts < 1) { policy_.max_attempts = 1; }
}

int32_t MetricsClient::BackoffSeconds(int16_t retry) const {
  return policy_.initial_delay_s + (retry - 1) * policy_.step_s;
}

FetchStatus MetricsClient::Fetch(const MetricSpec& spec,
                                 const std::string& instance, int64_t start,
                                 int64_t end, std::vector<Sample>* samples,
                                 std::string* reason) {
  samples->clear();
  if (start >= end) { return FETCH_OK; }

  const int64_t span =
      (int64_t)std::max(spec.period_s, 1) * datapoints_per_request;
  std::vector<Sample> collected;
  for (int64_t s = start; s < end; s += span) {
    int64_t e = std::min(s + span, end);
    std::vector<Sample> page;
    FetchStatus status = FetchWindow(spec, instance, s, e, &page, reason);
    if (status != FETCH_OK) { return status; }
    collected.insert(collected.end(), page.begin(), page.end());
  }

  std::stable_sort(collected.begin(), collected.end(), SampleBefore);
  samples->swap(collected);
  return FETCH_OK;
}

FetchStatus MetricsClient::FetchWindow(const MetricSpec& spec,
                                       const std::string& instance,
                                       int64_t start, int64_t end,
                                       std::vector<Sample>* samples,
                                       std::string* reason) {
  std::string error;
  for (int16_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    samples->clear();
    error.clear();
    FetchStatus status = backend_->FetchMetricStatistics(spec, instance, start,
                                                         end, samples, &error);
    if (status != FETCH_TRANSIENT) {
      if (status != FETCH_OK) { *reason = error; }
      return status;
    }
    if (attempt == policy_.max_attempts) { break; }

    int32_t delay = BackoffSeconds(attempt);
    std::cout << "[MetricsClient] " << spec.metric.Key() << " for " << instance
              << " failed (" << error << "), retrying in " << delay
              << " seconds (attempt " << attempt << " of "
              << policy_.max_attempts << ")" << std::endl;
    if (!sleeper_->SleepFor(std::chrono::seconds(delay))) {
      samples->clear();
      *reason = "cancelled during backoff";
      return FETCH_TRANSIENT;
    }
  }

  samples->clear();
  *reason = "gave up after " + std::to_string(policy_.max_attempts) +
            " attempts: " + error;
  std::cout << "[MetricsClient] Giving up on " << spec.metric.Key() << " for "
            << instance << std::endl;
  return FETCH_TRANSIENT;
}

}  // namespace internal
}  // namespace idlereaper
