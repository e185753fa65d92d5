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

#include <aws/ec2/model/DescribeInstancesRequest.h>
#include <aws/ec2/model/DescribeInstancesResponse.h>
#include <aws/ec2/model/Filter.h>
#include <aws/ec2/model/TerminateInstancesRequest.h>

#include "ec2_fleet.h"

namespace idlereaper {
namespace internal {

Ec2Fleet::Ec2Fleet(const Aws::Client::ClientConfiguration& client_config,
                   const std::string& tag_key, const std::string& worker_name)
    : ec2_(client_config), tag_key_(tag_key), worker_name_(worker_name) {}

int8_t Ec2Fleet::ListWorkers(const std::string& cluster,
                             std::vector<std::string>* instance_ids) {
  instance_ids->clear();

  Aws::EC2::Model::Filter cluster_filter;
  cluster_filter.SetName(Aws::String(("tag:" + tag_key_).c_str()));
  cluster_filter.AddValues(Aws::String(cluster.c_str()));

  Aws::EC2::Model::Filter state_filter;
  state_filter.SetName("instance-state-name");
  state_filter.AddValues("pending");
  state_filter.AddValues("running");

  std::string next_token = "";
  while (true) {
    Aws::EC2::Model::DescribeInstancesRequest request;
    request.AddFilters(cluster_filter);
    request.AddFilters(state_filter);
    if (!worker_name_.empty()) {
      Aws::EC2::Model::Filter name_filter;
      name_filter.SetName("tag:Name");
      name_filter.AddValues(Aws::String(worker_name_.c_str()));
      request.AddFilters(name_filter);
    }
    if (!next_token.empty()) {
      request.SetNextToken(Aws::String(next_token.c_str()));
    }

    auto outcome = ec2_.DescribeInstances(request);
    if (!outcome.IsSuccess()) {
      std::cerr << "[Ec2Fleet] Failed to describe instances of " << cluster
                << ": " << outcome.GetError().GetMessage() << std::endl;
      instance_ids->clear();
      return -1;
    }

    const auto& reservations = outcome.GetResult().GetReservations();
    for (const auto& reservation : reservations) {
      for (const auto& instance : reservation.GetInstances()) {
        Aws::String inst_id = instance.GetInstanceId();
        instance_ids->push_back(std::string(inst_id.c_str(), inst_id.size()));
      }
    }

    auto token = outcome.GetResult().GetNextToken();
    if (token.empty()) { break; }
    next_token = std::string(token.c_str(), token.size());
  }
  return 0;
}

int8_t Ec2Fleet::TerminateInstances(
    const std::vector<std::string>& instance_ids) {
  if (instance_ids.empty()) { return 0; }
  Aws::EC2::Model::TerminateInstancesRequest request;
  for (const std::string& inst_id : instance_ids) {
    request.AddInstanceIds(Aws::String(inst_id.c_str(), inst_id.size()));
  }
  request.SetDryRun(false);
  auto term_outcome = ec2_.TerminateInstances(request);
  if (!term_outcome.IsSuccess()) {
    std::cerr << "[Ec2Fleet] Failure to terminate";
    for (const std::string& inst_id : instance_ids) {
      std::cerr << " " << inst_id;
    }
    std::cerr << ": " << term_outcome.GetError().GetMessage() << std::endl;
    return -1;
  }
  return 0;
}

}  // namespace internal
}  // namespace idlereaper
