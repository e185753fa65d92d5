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
#include <vector>

#include <aws/core/utils/DateTime.h>
#include <aws/monitoring/CloudWatchErrors.h>
#include <aws/monitoring/model/Datapoint.h>
#include <aws/monitoring/model/Dimension.h>
#include <aws/monitoring/model/GetMetricStatisticsRequest.h>
#include <aws/monitoring/model/StandardUnit.h>
#include <aws/monitoring/model/Statistic.h>

#include "cloudwatch_backend.h"
#include "include/constants.h"

namespace idlereaper {
namespace internal {
namespace {

double datapoint_value(const Aws::CloudWatch::Model::Datapoint& dp,
                       Aws::CloudWatch::Model::Statistic stat) {
  using Aws::CloudWatch::Model::Statistic;
  switch (stat) {
  case Statistic::Maximum: return dp.GetMaximum();
  case Statistic::Minimum: return dp.GetMinimum();
  case Statistic::Sum: return dp.GetSum();
  case Statistic::SampleCount: return dp.GetSampleCount();
  default: return dp.GetAverage();
  }
}

}  // namespace

CloudWatchBackend::CloudWatchBackend(
    const Aws::Client::ClientConfiguration& client_config)
    : cw_(client_config) {}

FetchStatus CloudWatchBackend::FetchMetricStatistics(
    const MetricSpec& spec, const std::string& instance, int64_t start,
    int64_t end, std::vector<Sample>* samples, std::string* error) {
  using namespace Aws::CloudWatch::Model;

  Statistic stat = StatisticMapper::GetStatisticForName(
      Aws::String(spec.statistic.c_str()));
  if (stat == Statistic::NOT_SET) {
    *error = "unknown statistic " + spec.statistic;
    return FETCH_FAILED;
  }

  GetMetricStatisticsRequest request;
  request.SetNamespace(Aws::String(spec.metric.ns.c_str()));
  request.SetMetricName(Aws::String(spec.metric.name.c_str()));
  Dimension dimension;
  dimension.SetName(Aws::String(instance_dimension.c_str()));
  dimension.SetValue(Aws::String(instance.c_str()));
  request.AddDimensions(dimension);
  request.SetStartTime(Aws::Utils::DateTime(start * 1000));
  request.SetEndTime(Aws::Utils::DateTime(end * 1000));
  request.SetPeriod(spec.period_s);
  request.AddStatistics(stat);
  if (!spec.unit.empty()) {
    request.SetUnit(StandardUnitMapper::GetStandardUnitForName(
        Aws::String(spec.unit.c_str())));
  }

  auto outcome = cw_.GetMetricStatistics(request);
  if (!outcome.IsSuccess()) {
    auto aws_error = outcome.GetError();
    *error = std::string(aws_error.GetExceptionName().c_str()) + ": " +
             std::string(aws_error.GetMessage().c_str());
    if (aws_error.GetErrorType() ==
        Aws::CloudWatch::CloudWatchErrors::RESOURCE_NOT_FOUND) {
      return FETCH_NOT_FOUND;
    }
    if (aws_error.ShouldRetry()) { return FETCH_TRANSIENT; }
    return FETCH_FAILED;
  }

  for (const auto& dp : outcome.GetResult().GetDatapoints()) {
    Sample s;
    s.instance = instance;
    s.value = datapoint_value(dp, stat);
    s.timestamp = dp.GetTimestamp().Millis() / 1000;
    // CloudWatch may round the window outwards to the period.
    if (s.timestamp < start || s.timestamp >= end) { continue; }
    samples->push_back(s);
  }
  return FETCH_OK;
}

}  // namespace internal
}  // namespace idlereaper
