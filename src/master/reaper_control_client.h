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

#ifndef REAPER_CONTROL_CLIENT_H
#define REAPER_CONTROL_CLIENT_H

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "reapercontrol.grpc.pb.h"

using grpc::Channel;

namespace idlereaperpublic {
namespace reapercontrol {

class ReaperControlClient {
public:
  ReaperControlClient(std::shared_ptr<Channel> channel);

  // Heartbeat request
  RequestReply Heartbeat();

  // GetStatus request. The returned status says whether reply is valid.
  RequestReply GetStatus(StatusResponse* reply);

  // Stop request
  RequestReply Stop(const std::string& reason);

private:
  std::unique_ptr<ReaperControl::Stub> stub_;
};

}  // namespace reapercontrol
}  // namespace idlereaperpublic

#endif  // #ifndef REAPER_CONTROL_CLIENT_H
