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
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <aws/core/Aws.h>

#include "cloud/cloudwatch_alarm_gate.h"
#include "include/constants.h"
#include "monitor/monitor_config.h"

using namespace idlereaper::internal;

static void usage() {
  std::cout << "Usage: reaper_alarm [-R region] [-t threshold] [-l]"
            << " [-p periods] [-x prefix] [-d] <instance-id>..." << std::endl;
  std::cout << "Put (or with -d, delete) the idle watchdog alarm that"
            << " terminates each instance." << std::endl;
  std::cout << "-R, --region: AWS region (default " << default_region << ")"
            << std::endl;
  std::cout << "-t, --threshold: CPU percent (default "
            << default_alarm_threshold << ")" << std::endl;
  std::cout << "-l, --leader: use the leader threshold ("
            << default_leader_alarm_threshold << ")" << std::endl;
  std::cout << "-p, --periods: evaluation periods of 300 s (default "
            << default_alarm_periods << ")" << std::endl;
  std::cout << "-x, --prefix: alarm name prefix (default "
            << default_alarm_prefix << ")" << std::endl;
  std::cout << "-d, --delete: delete the alarms instead" << std::endl;
}

int main(int argc, char** argv) {
  std::string region = default_region;
  std::string prefix = default_alarm_prefix;
  double threshold = default_alarm_threshold;
  int16_t periods = default_alarm_periods;
  bool remove = false;

  struct option long_options[] = {
      {"region", required_argument, nullptr, 'R'},
      {"threshold", required_argument, nullptr, 't'},
      {"leader", no_argument, nullptr, 'l'},
      {"periods", required_argument, nullptr, 'p'},
      {"prefix", required_argument, nullptr, 'x'},
      {"delete", no_argument, nullptr, 'd'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  while (true) {
    const int opt = getopt_long(argc, argv, "R:t:lp:x:dh", long_options, NULL);

    if (opt == -1) { break; }

    switch (opt) {
      case 'R':
        region = std::string(optarg);
        break;

      case 't':
        threshold = std::stod(optarg);
        break;

      case 'l':
        threshold = default_leader_alarm_threshold;
        break;

      case 'p':
        periods = std::stoi(optarg);
        break;

      case 'x':
        prefix = std::string(optarg);
        break;

      case 'd':
        remove = true;
        break;

      case 'h':
        usage();
        return 0;

      default:
        usage();
        return 1;
    }
  }

  std::vector<std::string> instances;
  for (int i = optind; i < argc; ++i) { instances.push_back(argv[i]); }
  if (instances.empty()) {
    std::cout << "Must give at least one instance id" << std::endl
              << std::endl;
    usage();
    return 1;
  }
  if (periods < 1 || threshold < 0.0 || threshold > 100.0) {
    std::cout << "Invalid threshold or evaluation periods" << std::endl
              << std::endl;
    usage();
    return 1;
  }

  MonitorConfig defaults = DefaultMonitorConfig();
  const MetricSpec* cpu = FindMetric(defaults, defaults.idle_metric);

  int failures = 0;
  Aws::SDKOptions options;
  Aws::InitAPI(options);
  {
    Aws::Client::ClientConfiguration clientConfig;
    clientConfig.region = Aws::String(region.c_str());
    CloudWatchAlarmGate gate(clientConfig, prefix, periods);
    for (const std::string& id : instances) {
      int8_t rc = remove ? gate.DeleteAlarm(id)
                         : gate.PutAlarm(id, *cpu, threshold,
                                         TerminateActionArn(region));
      std::cout << (remove ? "Delete" : "Put") << " alarm "
                << gate.AlarmName(id) << " "
                << (rc ? "FAILED" : "SUCCEEDED") << std::endl;
      if (rc) { failures++; }
    }
  }
  Aws::ShutdownAPI(options);

  return failures ? 1 : 0;
}
