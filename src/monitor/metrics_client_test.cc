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

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "include/constants.h"
#include "metrics_client.h"
#include "test_fakes.h"

#define FAIL(x) printf("[FAIL]: " #x "\n")
#define PASS(x) printf("[PASS]: " #x "\n")

using namespace idlereaper::internal;

static const int64_t base_ts = 1452819900;

int main(int argc, char** argv) {
  MetricSpec cpu;
  cpu.metric.ns = "AWS/EC2";
  cpu.metric.name = "CPUUtilization";
  cpu.unit = "Percent";
  cpu.statistic = "Average";
  cpu.period_s = 300;

  RetryPolicy policy = {4, 30, 10};
  std::vector<Sample> samples;
  std::string reason;

  // A 10-day window needs three requests of at most four days each.
  {
    FakeBackend backend(base_ts);
    RecordingSleeper sleeper;
    MetricsClient client(&backend, policy, &sleeper);
    const int64_t start = base_ts;
    const int64_t end = base_ts + 10 * 24 * 3600;
    FetchStatus status =
        client.Fetch(cpu, "i-a", start, end, &samples, &reason);
    if (status != FETCH_OK || backend.calls != 3) {
      FAIL("Page a long window");
      std::cout << backend.calls << " requests" << std::endl;
      return 1;
    }
    for (size_t i = 0; i < backend.windows.size(); ++i) {
      const auto& w = backend.windows[i];
      int64_t expected_start = i == 0 ? start : backend.windows[i - 1].second;
      if (w.first != expected_start ||
          w.second - w.first > max_datapoints_per_request * cpu.period_s) {
        FAIL("Pages are contiguous and within the datapoint limit");
        return 1;
      }
    }
    if (backend.windows.back().second != end) {
      FAIL("Pages cover the window");
      return 1;
    }
    PASS("Page a long window");
  }

  // An empty window costs nothing.
  {
    FakeBackend backend(base_ts);
    RecordingSleeper sleeper;
    MetricsClient client(&backend, policy, &sleeper);
    if (client.Fetch(cpu, "i-a", base_ts, base_ts, &samples, &reason) !=
            FETCH_OK ||
        backend.calls != 0 || !samples.empty()) {
      FAIL("Empty window");
      return 1;
    }
    PASS("Empty window");
  }

  // Samples come back sorted.
  {
    FakeBackend backend(base_ts);
    backend.AddBatch(cpu.metric, "i-a", {0.3, 0.2, 0.1});
    RecordingSleeper sleeper;
    MetricsClient client(&backend, policy, &sleeper);
    FetchStatus status = client.Fetch(cpu, "i-a", base_ts - 3600,
                                      base_ts + 3600, &samples, &reason);
    if (status != FETCH_OK || samples.size() != 3 ||
        samples[0].timestamp != base_ts || samples[2].value != 0.1) {
      FAIL("Fetch samples");
      return 1;
    }
    PASS("Fetch samples");
  }

  // A backend that always throttles is tried max_attempts times with a
  // linear backoff in between.
  {
    FakeBackend backend(base_ts);
    backend.SetStatus(cpu.metric, "i-a", FETCH_TRANSIENT);
    RecordingSleeper sleeper;
    MetricsClient client(&backend, policy, &sleeper);
    FetchStatus status = client.Fetch(cpu, "i-a", base_ts, base_ts + 3600,
                                      &samples, &reason);
    if (status != FETCH_TRANSIENT || backend.calls != 4 ||
        !samples.empty() || reason.empty()) {
      FAIL("Retry budget");
      return 1;
    }
    if (sleeper.delays_s.size() != 3 || sleeper.delays_s[0] != 30 ||
        sleeper.delays_s[1] != 40 || sleeper.delays_s[2] != 50) {
      FAIL("Backoff delays");
      return 1;
    }
    if (client.BackoffSeconds(1) != 30 || client.BackoffSeconds(4) != 60) {
      FAIL("Backoff schedule");
      return 1;
    }
    PASS("Retry with backoff");
  }

  // Stopping during backoff ends the retries.
  {
    FakeBackend backend(base_ts);
    backend.SetStatus(cpu.metric, "i-a", FETCH_TRANSIENT);
    RecordingSleeper sleeper;
    sleeper.Stop();
    MetricsClient client(&backend, policy, &sleeper);
    FetchStatus status = client.Fetch(cpu, "i-a", base_ts, base_ts + 3600,
                                      &samples, &reason);
    if (status != FETCH_TRANSIENT || backend.calls != 1) {
      FAIL("Cancel during backoff");
      return 1;
    }
    PASS("Cancel during backoff");
  }

  // Permanent outcomes are passed through without retrying.
  {
    FakeBackend backend(base_ts);
    backend.SetStatus(cpu.metric, "i-gone", FETCH_NOT_FOUND);
    backend.SetStatus(cpu.metric, "i-denied", FETCH_FAILED);
    RecordingSleeper sleeper;
    MetricsClient client(&backend, policy, &sleeper);
    if (client.Fetch(cpu, "i-gone", base_ts, base_ts + 3600, &samples,
                     &reason) != FETCH_NOT_FOUND ||
        client.Fetch(cpu, "i-denied", base_ts, base_ts + 3600, &samples,
                     &reason) != FETCH_FAILED ||
        backend.calls != 2 || !sleeper.delays_s.empty()) {
      FAIL("Permanent failures are not retried");
      return 1;
    }
    PASS("Permanent failures are not retried");
  }

  // A failing page fails the whole fetch.
  {
    FakeBackend backend(base_ts);
    backend.AddBatch(cpu.metric, "i-a", {0.1});
    backend.SetStatus(cpu.metric, "i-a", FETCH_FAILED);
    RecordingSleeper sleeper;
    MetricsClient client(&backend, policy, &sleeper);
    FetchStatus status = client.Fetch(cpu, "i-a", base_ts,
                                      base_ts + 10 * 24 * 3600, &samples,
                                      &reason);
    if (status != FETCH_FAILED || !samples.empty()) {
      FAIL("No partial results");
      return 1;
    }
    PASS("No partial results");
  }

  return 0;
}
