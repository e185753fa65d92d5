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

#ifndef CLOUDWATCH_BACKEND_H
#define CLOUDWATCH_BACKEND_H

#include <cstdint>
#include <string>
#include <vector>

#include <aws/core/client/ClientConfiguration.h>
#include <aws/monitoring/CloudWatchClient.h>

#include "monitor/metrics_client.h"

namespace idlereaper {
namespace internal {

// GetMetricStatistics against CloudWatch, one request per call. Paging and
// retries are left to MetricsClient.
class CloudWatchBackend : public MetricsBackend {
public:
  explicit CloudWatchBackend(
      const Aws::Client::ClientConfiguration& client_config);

  FetchStatus FetchMetricStatistics(const MetricSpec& spec,
                                    const std::string& instance, int64_t start,
                                    int64_t end, std::vector<Sample>* samples,
                                    std::string* error) override;

private:
  Aws::CloudWatch::CloudWatchClient cw_;
};

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef CLOUDWATCH_BACKEND_H
