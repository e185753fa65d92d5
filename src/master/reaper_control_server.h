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

#ifndef REAPER_CONTROL_SERVER_H
#define REAPER_CONTROL_SERVER_H

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>
#include "monitor/fleet_controller.h"
#include "reapercontrol.grpc.pb.h"

namespace idlereaperpublic {
namespace reapercontrol {

class ReaperControlServiceImpl final : public ReaperControl::Service {
public:
  // controller is not owned and must outlive the service.
  ReaperControlServiceImpl(idlereaper::internal::FleetController* controller,
                           const std::string& cluster,
                           const std::string& run_dir);

  grpc::Status Heartbeat(grpc::ServerContext* context,
                         const HeartbeatRequest* request,
                         HeartbeatResponse* reply) override;

  grpc::Status GetStatus(grpc::ServerContext* context,
                         const StatusRequest* request,
                         StatusResponse* reply) override;

  grpc::Status Stop(grpc::ServerContext* context, const StopRequest* request,
                    StopResponse* reply) override;

private:
  idlereaper::internal::FleetController* controller_;
  const std::string cluster_;
  const std::string run_dir_;
};

// Listen on address without authentication. Returns NULL if the server
// cannot be started. The caller shuts it down.
std::unique_ptr<grpc::Server> StartControlServer(
    const std::string& address, ReaperControlServiceImpl* service);

}  // namespace reapercontrol
}  // namespace idlereaperpublic

#endif  // #ifndef REAPER_CONTROL_SERVER_H
