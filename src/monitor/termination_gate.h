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

#ifndef TERMINATION_GATE_H
#define TERMINATION_GATE_H

#include <cstdint>
#include <string>

#include "metric_types.h"

namespace idlereaper {
namespace internal {

// A standing watchdog per instance that fires `action` when `metric` stays
// below `threshold`. It works independently of the polling loop, so a worker
// is still reclaimed if the monitor dies.
class TerminationGate {
public:
  virtual ~TerminationGate() {}

  // Return 0 means success, -1 means error.
  virtual int8_t PutAlarm(const std::string& instance, const MetricSpec& metric,
                          double threshold, const std::string& action) = 0;

  virtual int8_t DeleteAlarm(const std::string& instance) = 0;
};

// The EC2 automate action that terminates the alarmed instance.
inline std::string TerminateActionArn(const std::string& region) {
  return "arn:aws:automate:" + region + ":ec2:terminate";
}

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef TERMINATION_GATE_H
