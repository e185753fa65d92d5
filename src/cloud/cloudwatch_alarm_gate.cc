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
#include <iostream>
#include <string>

#include <aws/monitoring/model/ComparisonOperator.h>
#include <aws/monitoring/model/DeleteAlarmsRequest.h>
#include <aws/monitoring/model/Dimension.h>
#include <aws/monitoring/model/PutMetricAlarmRequest.h>
#include <aws/monitoring/model/StandardUnit.h>
#include <aws/monitoring/model/Statistic.h>

#include "cloudwatch_alarm_gate.h"
#include "include/constants.h"

namespace idlereaper {
namespace internal {

CloudWatchAlarmGate::CloudWatchAlarmGate(
    const Aws::Client::ClientConfiguration& client_config,
    const std::string& prefix, int16_t evaluation_periods)
    : cw_(client_config),
      prefix_(prefix),
      evaluation_periods_(evaluation_periods) {}

std::string CloudWatchAlarmGate::AlarmName(const std::string& instance) const {
  return prefix_ + "-" + instance;
}

int8_t CloudWatchAlarmGate::PutAlarm(const std::string& instance,
                                     const MetricSpec& metric,
                                     double threshold,
                                     const std::string& action) {
  using namespace Aws::CloudWatch::Model;
  const std::string alarm_name = AlarmName(instance);

  PutMetricAlarmRequest request;
  request.SetAlarmName(Aws::String(alarm_name.c_str()));
  request.SetAlarmDescription(
      Aws::String(("Terminate " + instance + " when idle").c_str()));
  request.SetNamespace(Aws::String(metric.metric.ns.c_str()));
  request.SetMetricName(Aws::String(metric.metric.name.c_str()));
  Dimension dimension;
  dimension.SetName(Aws::String(instance_dimension.c_str()));
  dimension.SetValue(Aws::String(instance.c_str()));
  request.AddDimensions(dimension);
  request.SetStatistic(StatisticMapper::GetStatisticForName(
      Aws::String(metric.statistic.c_str())));
  request.SetUnit(StandardUnitMapper::GetStandardUnitForName(
      Aws::String(metric.unit.c_str())));
  request.SetPeriod(metric.period_s);
  request.SetEvaluationPeriods(evaluation_periods_);
  request.SetThreshold(threshold);
  request.SetComparisonOperator(ComparisonOperator::LessThanThreshold);
  request.SetActionsEnabled(true);
  request.AddAlarmActions(Aws::String(action.c_str()));

  auto outcome = cw_.PutMetricAlarm(request);
  if (!outcome.IsSuccess()) {
    std::cerr << "[CloudWatchAlarmGate] Failed to put alarm " << alarm_name
              << ": " << outcome.GetError().GetMessage() << std::endl;
    return -1;
  }
  std::cout << "[LOG]: Put alarm " << alarm_name << " (" << metric.metric.name
            << " < " << threshold << " for " << evaluation_periods_ << " x "
            << metric.period_s << " s)" << std::endl;
  return 0;
}

int8_t CloudWatchAlarmGate::DeleteAlarm(const std::string& instance) {
  const std::string alarm_name = AlarmName(instance);
  Aws::CloudWatch::Model::DeleteAlarmsRequest request;
  request.AddAlarmNames(Aws::String(alarm_name.c_str()));
  auto outcome = cw_.DeleteAlarms(request);
  if (!outcome.IsSuccess()) {
    std::cerr << "[CloudWatchAlarmGate] Failed to delete alarm " << alarm_name
              << ": " << outcome.GetError().GetMessage() << std::endl;
    return -1;
  }
  return 0;
}

}  // namespace internal
}  // namespace idlereaper
