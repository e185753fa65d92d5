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

// Value types shared by the monitor loop and its collaborators.
#ifndef METRIC_TYPES_H
#define METRIC_TYPES_H

#include <time.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace idlereaper {
namespace internal {

// A CloudWatch metric, e.g. ("AWS/EC2", "CPUUtilization").
struct MetricName {
  std::string ns;
  std::string name;

  std::string Key() const { return ns + "/" + name; }
};

inline bool operator==(const MetricName& a, const MetricName& b) {
  return a.ns == b.ns && a.name == b.name;
}

inline bool operator!=(const MetricName& a, const MetricName& b) {
  return !(a == b);
}

inline bool operator<(const MetricName& a, const MetricName& b) {
  return a.ns < b.ns || (a.ns == b.ns && a.name < b.name);
}

// A tracked metric and how to request it. unit is a CloudWatch StandardUnit
// name ("Percent", "Bytes", "Count", ...).
struct MetricSpec {
  MetricName metric;
  std::string unit;
  std::string statistic;
  int32_t period_s;
};

// One datapoint. timestamp is in seconds since the epoch (UTC).
struct Sample {
  std::string instance;
  double value;
  int64_t timestamp;
};

inline bool SampleBefore(const Sample& a, const Sample& b) {
  return a.timestamp < b.timestamp;
}

enum FetchStatus {
  FETCH_OK = 0,
  FETCH_TRANSIENT,  // throttled or 5xx; retryable
  FETCH_NOT_FOUND,  // the instance no longer exists
  FETCH_FAILED      // permanent; not retried
};

inline const char* FetchStatusName(FetchStatus status) {
  switch (status) {
    case FETCH_OK:
      return "ok";
    case FETCH_TRANSIENT:
      return "transient";
    case FETCH_NOT_FOUND:
      return "not-found";
    case FETCH_FAILED:
      return "failed";
  }
  return "unknown";
}

// Samples are the run's only durable record, so failing to persist them
// stops the loop.
class PersistenceError : public std::runtime_error {
public:
  explicit PersistenceError(const std::string& what)
      : std::runtime_error(what) {}
};

// Current wall-clock time in seconds since the epoch.
inline int64_t get_curr_seconds() {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return (int64_t)ts.tv_sec;
}

// Format as ISO-8601 UTC, e.g. "2016-01-15T01:05:00Z".
std::string FormatTimestamp(int64_t timestamp);

// Format the UTC date only, e.g. "2016-01-15".
std::string FormatDate(int64_t timestamp);

// Parse the output of FormatTimestamp.
// Return 0 means success, -1 means the string is malformed.
int8_t ParseTimestamp(const std::string& text, int64_t* timestamp);

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef METRIC_TYPES_H
