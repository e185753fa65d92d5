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

#include <string.h>
#include <time.h>
#include <cstdint>
#include <string>

#include "metric_types.h"

namespace idlereaper {
namespace internal {
namespace {

std::string format_utc(int64_t timestamp, const char* fmt) {
  time_t t = (time_t)timestamp;
  struct tm tm_utc;
  gmtime_r(&t, &tm_utc);
  char buffer[32];
  size_t len = strftime(buffer, sizeof buffer, fmt, &tm_utc);
  return std::string(buffer, len);
}

}  // namespace

std::string FormatTimestamp(int64_t timestamp) {
  return format_utc(timestamp, "%Y-%m-%dT%H:%M:%SZ");
}

std::string FormatDate(int64_t timestamp) {
  return format_utc(timestamp, "%Y-%m-%d");
}

int8_t ParseTimestamp(const std::string& text, int64_t* timestamp) {
  struct tm tm_utc;
  memset(&tm_utc, 0, sizeof tm_utc);
  const char* end = strptime(text.c_str(), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
  if (end == NULL || *end != '\0') { return -1; }
  *timestamp = (int64_t)timegm(&tm_utc);
  return 0;
}

}  // namespace internal
}  // namespace idlereaper
