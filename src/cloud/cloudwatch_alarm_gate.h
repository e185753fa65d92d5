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

#ifndef CLOUDWATCH_ALARM_GATE_H
#define CLOUDWATCH_ALARM_GATE_H

#include <cstdint>
#include <string>

#include <aws/core/client/ClientConfiguration.h>
#include <aws/monitoring/CloudWatchClient.h>

#include "monitor/termination_gate.h"

namespace idlereaper {
namespace internal {

// Alarms are named <prefix>-<instance> so reruns overwrite them.
class CloudWatchAlarmGate : public TerminationGate {
public:
  CloudWatchAlarmGate(const Aws::Client::ClientConfiguration& client_config,
                      const std::string& prefix, int16_t evaluation_periods);

  int8_t PutAlarm(const std::string& instance, const MetricSpec& metric,
                  double threshold, const std::string& action) override;

  int8_t DeleteAlarm(const std::string& instance) override;

  std::string AlarmName(const std::string& instance) const;

private:
  Aws::CloudWatch::CloudWatchClient cw_;
  std::string prefix_;
  int16_t evaluation_periods_;
};

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef CLOUDWATCH_ALARM_GATE_H
