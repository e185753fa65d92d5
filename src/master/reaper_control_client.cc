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

#include <iostream>
#include <memory>
#include <string>

#include "reaper_control_client.h"

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;

namespace idlereaperpublic {
namespace reapercontrol {
namespace {

RequestReply rpc_failure(const Status& status) {
  std::cout << status.error_code() << ": " << status.error_message()
            << std::endl;
  RequestReply rs;
  rs.set_status(RequestReplyEnum::INVALID);
  rs.set_msg(status.error_message());
  return rs;
}

}  // namespace

ReaperControlClient::ReaperControlClient(std::shared_ptr<Channel> channel)
    : stub_(ReaperControl::NewStub(channel)) {}

RequestReply ReaperControlClient::Heartbeat() {
  HeartbeatRequest request;
  RequestReply rs;
  rs.set_status(RequestReplyEnum::SUCCESS);
  request.mutable_status()->CopyFrom(rs);

  HeartbeatResponse reply;
  ClientContext context;
  Status status = stub_->Heartbeat(&context, request, &reply);
  if (status.ok()) {
    return reply.status();
  } else {
    return rpc_failure(status);
  }
}

RequestReply ReaperControlClient::GetStatus(StatusResponse* reply) {
  StatusRequest request;
  ClientContext context;
  Status status = stub_->GetStatus(&context, request, reply);
  if (status.ok()) {
    return reply->status();
  } else {
    return rpc_failure(status);
  }
}

RequestReply ReaperControlClient::Stop(const std::string& reason) {
  StopRequest request;
  request.set_reason(reason);

  StopResponse reply;
  ClientContext context;
  Status status = stub_->Stop(&context, request, &reply);
  if (status.ok()) {
    return reply.status();
  } else {
    return rpc_failure(status);
  }
}

}  // namespace reapercontrol
}  // namespace idlereaperpublic
