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

#include "reaper_control_server.h"

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ServerContext;
using grpc::Status;

namespace idlereaperpublic {
namespace reapercontrol {

ReaperControlServiceImpl::ReaperControlServiceImpl(
    idlereaper::internal::FleetController* controller,
    const std::string& cluster, const std::string& run_dir)
    : controller_(controller), cluster_(cluster), run_dir_(run_dir) {}

Status ReaperControlServiceImpl::Heartbeat(ServerContext* context,
                                           const HeartbeatRequest* request,
                                           HeartbeatResponse* reply) {
  RequestReply* rs = reply->mutable_status();
  if (request->status().status() != RequestReplyEnum::SUCCESS) {
    rs->set_status(RequestReplyEnum::INVALID);
    rs->set_msg("Received invalid heartbeat");
    return Status::OK;
  }

  rs->set_status(RequestReplyEnum::SUCCESS);
  rs->set_msg("Successfully received heartbeat");
  return Status::OK;
}

Status ReaperControlServiceImpl::GetStatus(ServerContext* context,
                                           const StatusRequest* request,
                                           StatusResponse* reply) {
  idlereaper::internal::ControllerStatus snapshot = controller_->Status();

  reply->set_cluster(cluster_);
  reply->set_run_dir(run_dir_);
  reply->set_running(snapshot.running);
  reply->set_cycles(snapshot.cycles);
  for (const std::string& id : snapshot.tracked) { reply->add_tracked(id); }
  for (const std::string& id : snapshot.terminated) {
    reply->add_terminated(id);
  }

  const idlereaper::internal::CycleSummary& last = snapshot.last_cycle;
  CycleSummary* summary = reply->mutable_last_cycle();
  summary->set_cycle(last.cycle);
  summary->set_polled(last.polled);
  summary->set_flagged(last.flagged);
  summary->set_terminated(last.terminated);
  summary->set_dropped(last.dropped);
  for (const std::string& s : last.skipped) { summary->add_skipped(s); }
  summary->set_backend_outage(last.backend_outage);
  summary->set_elapsed_s(last.elapsed_s);

  RequestReply* rs = reply->mutable_status();
  rs->set_status(RequestReplyEnum::SUCCESS);
  rs->set_msg("Status of " + cluster_);
  return Status::OK;
}

Status ReaperControlServiceImpl::Stop(ServerContext* context,
                                      const StopRequest* request,
                                      StopResponse* reply) {
  std::cout << "[LOG]: Stop requested over RPC";
  if (!request->reason().empty()) { std::cout << ": " << request->reason(); }
  std::cout << std::endl;
  controller_->Stop();

  RequestReply* rs = reply->mutable_status();
  rs->set_status(RequestReplyEnum::SUCCESS);
  rs->set_msg("Stopping the monitor of " + cluster_);
  return Status::OK;
}

std::unique_ptr<Server> StartControlServer(
    const std::string& address, ReaperControlServiceImpl* service) {
  ServerBuilder builder;
  // Listen on the given address without any authentication mechanism.
  builder.AddListeningPort(address, grpc::InsecureServerCredentials());
  builder.RegisterService(service);
  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (server == nullptr) {
    std::cerr << "[ReaperControl] Failed to listen on " << address
              << std::endl;
    return nullptr;
  }
  std::cout << "Server listening on " << address << std::endl;
  return server;
}

}  // namespace reapercontrol
}  // namespace idlereaperpublic
