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

#ifndef EC2_FLEET_H
#define EC2_FLEET_H

#include <cstdint>
#include <string>
#include <vector>

#include <aws/core/client/ClientConfiguration.h>
#include <aws/ec2/EC2Client.h>

#include "monitor/fleet_membership.h"

namespace idlereaper {
namespace internal {

// Workers are the pending or running instances tagged
// <tag_key>=<cluster>, optionally narrowed to a Name tag.
class Ec2Fleet : public FleetMembership {
public:
  Ec2Fleet(const Aws::Client::ClientConfiguration& client_config,
           const std::string& tag_key, const std::string& worker_name);

  int8_t ListWorkers(const std::string& cluster,
                     std::vector<std::string>* instance_ids) override;

  int8_t TerminateInstances(
      const std::vector<std::string>& instance_ids) override;

private:
  Aws::EC2::EC2Client ec2_;
  std::string tag_key_;
  std::string worker_name_;
};

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef EC2_FLEET_H
