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

#ifndef FLEET_MEMBERSHIP_H
#define FLEET_MEMBERSHIP_H

#include <cstdint>
#include <string>
#include <vector>

namespace idlereaper {
namespace internal {

// The cloud provider's view of the worker fleet. Membership is re-read
// every cycle; the monitor never caches it across cycles.
class FleetMembership {
public:
  virtual ~FleetMembership() {}

  // Live workers of the cluster.
  // Return 0 means success, -1 means the fleet could not be listed (which is
  // not the same as an empty fleet).
  virtual int8_t ListWorkers(const std::string& cluster,
                             std::vector<std::string>* instance_ids) = 0;

  // Best effort. Return 0 means success, -1 means error.
  virtual int8_t TerminateInstances(
      const std::vector<std::string>& instance_ids) = 0;
};

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef FLEET_MEMBERSHIP_H
