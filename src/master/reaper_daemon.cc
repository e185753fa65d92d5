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
#include <signal.h>
#include <time.h>
#include <atomic>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <aws/core/Aws.h>
#include <aws/core/utils/UUID.h>

#include "cloud/cloudwatch_alarm_gate.h"
#include "cloud/cloudwatch_backend.h"
#include "cloud/ec2_fleet.h"
#include "cloud/run_archiver.h"
#include "include/constants.h"
#include "master/reaper_control_server.h"
#include "monitor/fleet_controller.h"
#include "monitor/monitor_config.h"

using namespace idlereaper::internal;

static void usage() {
  std::cout << "Usage: reaper_daemon [-c config.json] [-n cluster]"
            << " [-r run_id] [-o output_root] [-R region]" << std::endl;
  std::cout << "-c, --config: JSON configuration file" << std::endl;
  std::cout << "-n, --cluster: cluster to monitor (overrides the file)"
            << std::endl;
  std::cout << "-r, --run_id: resume or name a run (default: random UUID)"
            << std::endl;
  std::cout << "-o, --output_root: where the run directory is created"
            << std::endl;
  std::cout << "-R, --region: AWS region" << std::endl;
}

static int8_t write_run_summary(const std::string& run_dir,
                                const MonitorConfig& config,
                                const ControllerStatus& status,
                                RunResult result) {
  const std::string path = run_dir + "/" + run_summary_file;
  std::ofstream outfile(path, std::ios::out | std::ios::trunc);
  outfile << "run_id\t" << config.run_id << std::endl;
  outfile << "cluster\t" << config.cluster << std::endl;
  outfile << "finished\t" << FormatTimestamp(get_curr_seconds()) << std::endl;
  outfile << "result\t" << (result == RUN_DRAINED ? "drained" : "cancelled")
          << std::endl;
  outfile << "cycles\t" << status.cycles << std::endl;
  for (const std::string& id : status.terminated) {
    outfile << "terminated\t" << id << std::endl;
  }
  for (const std::string& id : status.tracked) {
    outfile << "tracked\t" << id << std::endl;
  }
  outfile.flush();
  if (!outfile.good()) {
    std::cerr << "[LOG]: Failed to write " << path << std::endl;
    return -1;
  }
  return 0;
}

// Owns every AWS client, so it must return before Aws::ShutdownAPI.
static int RunDaemon(MonitorConfig config) {
  Aws::Client::ClientConfiguration clientConfig;
  clientConfig.region = Aws::String(config.region.c_str());

  if (config.run_id.empty()) {
    Aws::String uuid = Aws::Utils::UUID::RandomUUID();
    config.run_id = std::string(uuid.c_str(), uuid.size());
  }
  const int64_t loop_start = get_curr_seconds();
  const std::string run_dir =
      config.output_root + "/" +
      MetricStore::RunDirName(config.run_id, loop_start);

  MonitorContext ctx;
  ctx.config = config;
  ctx.sleeper.reset(new CancellableSleeper());
  ctx.fleet.reset(
      new Ec2Fleet(clientConfig, config.cluster_tag_key, config.worker_name));
  ctx.backend.reset(new CloudWatchBackend(clientConfig));
  ctx.client.reset(
      new MetricsClient(ctx.backend.get(), config.retry, ctx.sleeper.get()));
  ctx.store.reset(new MetricStore(run_dir, config.metrics,
                                  loop_start - config.watermark_margin_s));
  if (config.alarm.enabled) {
    ctx.gate.reset(new CloudWatchAlarmGate(clientConfig, config.alarm.prefix,
                                           config.alarm.evaluation_periods));
  }

  try {
    ctx.store->Recover();
  } catch (const PersistenceError& e) {
    std::cerr << "[LOG]: " << e.what() << std::endl;
    return 1;
  }
  std::cout << "[LOG]: Run " << config.run_id << " writing to " << run_dir
            << std::endl;

  FleetController controller(&ctx);

  // SIGINT and SIGTERM are blocked in every thread and collected here.
  std::atomic<bool> done(false);
  std::thread signal_thread([&]() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    struct timespec timeout = {1, 0};
    while (!done) {
      int sig = sigtimedwait(&set, NULL, &timeout);
      if (sig == SIGINT || sig == SIGTERM) {
        std::cout << "[LOG]: Received signal " << sig << ", stopping"
                  << std::endl;
        controller.Stop();
      }
    }
  });

  std::unique_ptr<idlereaperpublic::reapercontrol::ReaperControlServiceImpl>
      service;
  std::unique_ptr<grpc::Server> server;
  if (!config.control_address.empty()) {
    service.reset(new idlereaperpublic::reapercontrol::ReaperControlServiceImpl(
        &controller, config.cluster, run_dir));
    server = idlereaperpublic::reapercontrol::StartControlServer(
        config.control_address, service.get());
    if (server == nullptr) {
      std::cerr << "[LOG]: Continuing without the control service"
                << std::endl;
    }
  }

  RunResult result;
  int rc = controller.RunToEnd(&result) ? 1 : 0;

  if (rc == 0) {
    if (write_run_summary(run_dir, config, controller.Status(), result)) {
      rc = 1;
    } else if (result == RUN_DRAINED && !config.archive_bucket.empty()) {
      RunArchiver archiver(clientConfig, config.archive_bucket,
                           config.archive_prefix);
      if (archiver.Archive(run_dir)) {
        std::cerr << "[LOG]: Archive failed, samples remain in " << run_dir
                  << std::endl;
        rc = 1;
      }
    }
  }

  if (server != nullptr) { server->Shutdown(); }
  done = true;
  signal_thread.join();
  std::cout << "[LOG]: Monitor of " << config.cluster << " exiting with " << rc
            << std::endl;
  return rc;
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string cluster, run_id, output_root, region;

  struct option long_options[] = {
      {"config", required_argument, nullptr, 'c'},
      {"cluster", required_argument, nullptr, 'n'},
      {"run_id", required_argument, nullptr, 'r'},
      {"output_root", required_argument, nullptr, 'o'},
      {"region", required_argument, nullptr, 'R'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  while (true) {
    const int opt = getopt_long(argc, argv, "c:n:r:o:R:h", long_options, NULL);

    if (opt == -1) { break; }

    switch (opt) {
      case 'c':
        config_path = std::string(optarg);
        break;

      case 'n':
        cluster = std::string(optarg);
        break;

      case 'r':
        run_id = std::string(optarg);
        break;

      case 'o':
        output_root = std::string(optarg);
        break;

      case 'R':
        region = std::string(optarg);
        break;

      case 'h':
        usage();
        return 0;

      default:
        usage();
        return 1;
    }
  }

  MonitorConfig config;
  try {
    config = config_path.empty() ? DefaultMonitorConfig()
                                 : LoadMonitorConfig(config_path);
    if (!cluster.empty()) { config.cluster = cluster; }
    if (!run_id.empty()) { config.run_id = run_id; }
    if (!output_root.empty()) { config.output_root = output_root; }
    if (!region.empty()) { config.region = region; }
    ValidateMonitorConfig(config);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Invalid configuration: " << e.what() << std::endl
              << std::endl;
    usage();
    return 1;
  }

  // Block before any thread exists so every thread inherits the mask.
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &set, NULL);

  // Set up AWS SDK
  Aws::SDKOptions options;
  Aws::InitAPI(options);
  int rc = RunDaemon(config);
  Aws::ShutdownAPI(options);
  return rc;
}
