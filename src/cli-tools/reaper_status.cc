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

#include <getopt.h>
#include <iostream>
#include <string>

#include "include/constants.h"
#include "master/reaper_control_client.h"

static void usage() {
  std::cout << "Usage: reaper_status [-a address]" << std::endl;
  std::cout << "-a, --address: control service of the daemon (default "
            << default_control_target << ")"
            << std::endl;
}

int main(int argc, char** argv) {
  std::string address = default_control_target;

  struct option long_options[] = {
      {"address", required_argument, nullptr, 'a'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  while (true) {
    const int opt = getopt_long(argc, argv, "a:h", long_options, NULL);

    if (opt == -1) { break; }

    switch (opt) {
      case 'a':
        address = std::string(optarg);
        break;

      case 'h':
        usage();
        return 0;

      default:
        usage();
        return 1;
    }
  }

  idlereaperpublic::reapercontrol::ReaperControlClient control(
      grpc::CreateChannel(address, grpc::InsecureChannelCredentials()));

  idlereaperpublic::reapercontrol::StatusResponse reply;
  idlereaperpublic::RequestReply rs = control.GetStatus(&reply);
  if (rs.status() != idlereaperpublic::RequestReplyEnum::SUCCESS) {
    std::cout << "Status query to " << address << " FAILED: " << rs.msg()
              << std::endl;
    return 1;
  }

  std::cout << "Cluster: " << reply.cluster() << std::endl;
  std::cout << "Run directory: " << reply.run_dir() << std::endl;
  std::cout << "Running: " << (reply.running() ? "yes" : "no") << std::endl;
  std::cout << "Cycles: " << reply.cycles() << std::endl;
  std::cout << "Tracked (" << reply.tracked_size() << "): " << std::endl;
  for (auto& id : reply.tracked()) { std::cout << "\t" << id << std::endl; }
  std::cout << "Terminated (" << reply.terminated_size() << "): " << std::endl;
  for (auto& id : reply.terminated()) { std::cout << "\t" << id << std::endl; }

  const auto& last = reply.last_cycle();
  std::cout << "Last cycle: cycle=" << last.cycle()
            << " polled=" << last.polled() << " flagged=" << last.flagged()
            << " terminated=" << last.terminated()
            << " dropped=" << last.dropped()
            << " skipped=" << last.skipped_size()
            << " backend_outage=" << (last.backend_outage() ? 1 : 0)
            << " elapsed_s=" << last.elapsed_s() << std::endl;
  for (auto& s : last.skipped()) {
    std::cout << "\tskipped " << s << std::endl;
  }

  return 0;
}
