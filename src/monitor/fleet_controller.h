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

// This file contains the idle-reaping loop. Each cycle it lists the fleet,
// collects new samples of every tracked metric per instance, decides which
// instances are idle from the utilization metric, terminates them, and
// sleeps until the next interval. The loop ends once the fleet is empty.
#ifndef FLEET_CONTROLLER_H
#define FLEET_CONTROLLER_H

#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "cancellable_sleeper.h"
#include "fleet_membership.h"
#include "idleness_evaluator.h"
#include "metric_store.h"
#include "metrics_client.h"
#include "monitor_config.h"
#include "termination_gate.h"

namespace idlereaper {
namespace internal {

// Everything one run needs. The caller builds it and keeps it alive while
// the controller runs. gate may be left empty.
struct MonitorContext {
  MonitorConfig config;
  std::unique_ptr<CancellableSleeper> sleeper;
  std::unique_ptr<FleetMembership> fleet;
  std::unique_ptr<MetricsBackend> backend;
  std::unique_ptr<MetricsClient> client;  // usually on top of backend
  std::unique_ptr<MetricStore> store;
  std::unique_ptr<TerminationGate> gate;
};

enum RunResult { RUN_DRAINED = 0, RUN_CANCELLED };

enum CycleOutcome {
  CYCLE_DONE = 0,
  CYCLE_DRAINED,    // no live workers left
  CYCLE_SKIPPED,    // the fleet could not be listed
  CYCLE_CANCELLED   // Stop() was called while collecting
};

struct CycleSummary {
  int64_t cycle;
  size_t polled;
  size_t flagged;
  size_t terminated;
  size_t dropped;
  std::vector<std::string> skipped;  // "<instance> <metric>: <reason>"
  bool backend_outage;
  double elapsed_s;
};

struct ControllerStatus {
  bool running;
  int64_t cycles;
  std::vector<std::string> tracked;
  std::vector<std::string> terminated;
  CycleSummary last_cycle;
};

class FleetController {
public:
  // Throws std::invalid_argument if the idle settings are invalid.
  explicit FleetController(MonitorContext* ctx);

  // Wait out the warm-up, then cycle until the fleet drains or Stop() is
  // called. Throws PersistenceError if samples cannot be written.
  RunResult Run();

  // Run() for the daemon: a failure that ends the loop is logged instead of
  // thrown. Return 0 when the loop ended normally, -1 otherwise.
  int8_t RunToEnd(RunResult* result);

  // One enumerate/collect/evaluate/act pass, without pacing.
  CycleOutcome RunCycle(CycleSummary* summary);

  // Safe to call from any thread.
  void Stop();
  ControllerStatus Status() const;

private:
  struct InstanceResult {
    std::string instance;
    bool not_found;
    bool idle_metric_fresh;  // new utilization samples arrived this cycle
    size_t attempted;
    size_t transient;
    std::vector<std::string> skipped;
  };

  RunResult Loop();
  void Collect(const std::vector<std::string>& instances, int64_t window_end,
               std::vector<InstanceResult>* results);
  void CollectInstance(const std::string& instance, int64_t window_end,
                       InstanceResult* result);
  void ApplyAlarms(const std::vector<std::string>& instances);
  void Retire(const std::string& instance);
  void LogSummary(const CycleSummary& summary) const;
  void SetRunning(bool running);

  MonitorContext* ctx_;
  IdlenessEvaluator evaluator_;

  // Only touched by the thread running the loop.
  std::set<std::string> retired_;  // terminated or vanished; never re-tracked
  std::set<std::string> alarmed_;
  int64_t cycle_;

  mutable std::mutex status_mutex_;
  ControllerStatus status_;
};

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef FLEET_CONTROLLER_H
