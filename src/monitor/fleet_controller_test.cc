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

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "fleet_controller.h"
#include "test_fakes.h"

#define FAIL(x) printf("[FAIL]: " #x "\n")
#define PASS(x) printf("[PASS]: " #x "\n")

using namespace idlereaper::internal;

class FakeGate : public TerminationGate {
public:
  FakeGate() : put_calls(0) {}

  int8_t PutAlarm(const std::string& instance, const MetricSpec& metric,
                  double threshold, const std::string& action) override {
    put_calls++;
    last_action = action;
    alarmed.insert(instance);
    return 0;
  }

  int8_t DeleteAlarm(const std::string& instance) override {
    alarmed.erase(instance);
    return 0;
  }

  int put_calls;
  std::string last_action;
  std::set<std::string> alarmed;
};

struct Harness {
  MonitorContext ctx;
  FakeFleet* fleet;
  FakeBackend* backend;
  RecordingSleeper* sleeper;  // NULL with a real sleeper
  int64_t default_wm;
  int64_t first_ts;  // timestamp of the first scripted sample
};

static MetricSpec cpu_spec() {
  MonitorConfig defaults = DefaultMonitorConfig();
  return *FindMetric(defaults, defaults.idle_metric);
}

static MetricSpec network_spec() {
  MetricSpec spec = cpu_spec();
  spec.metric.name = "NetworkIn";
  spec.unit = "Bytes";
  return spec;
}

static MonitorConfig test_config(bool with_network) {
  MonitorConfig config = DefaultMonitorConfig();
  config.cluster = "test-cluster";
  config.metrics.clear();
  config.metrics.push_back(cpu_spec());
  if (with_network) { config.metrics.push_back(network_spec()); }
  config.warmup_s = 0;
  config.interval_s = 0;
  config.fetch_workers = 2;
  config.control_address = "";
  return config;
}

static void setup(Harness* h, const MonitorConfig& config,
                  bool real_sleeper = false,
                  const std::string& run_dir = "") {
  const int64_t now = get_curr_seconds();
  h->default_wm = now - config.watermark_margin_s;
  h->ctx.config = config;
  if (real_sleeper) {
    h->sleeper = NULL;
    h->ctx.sleeper.reset(new CancellableSleeper());
  } else {
    h->sleeper = new RecordingSleeper();
    h->ctx.sleeper.reset(h->sleeper);
  }
  h->fleet = new FakeFleet();
  h->ctx.fleet.reset(h->fleet);
  h->first_ts = now - 1500;
  h->backend = new FakeBackend(h->first_ts);
  h->ctx.backend.reset(h->backend);
  h->ctx.client.reset(
      new MetricsClient(h->backend, config.retry, h->ctx.sleeper.get()));
  if (run_dir.empty()) {
    h->ctx.store.reset(new MetricStore(make_temp_dir() + "/run",
                                       config.metrics, h->default_wm));
    h->ctx.store->Recover();
  } else {
    h->ctx.store.reset(new MetricStore(run_dir, config.metrics, h->default_wm));
  }
}

static size_t count_lines(const std::string& path) {
  std::ifstream infile(path);
  std::string line;
  size_t n = 0;
  while (std::getline(infile, line)) {
    if (!line.empty()) { n++; }
  }
  return n;
}

int main(int argc, char** argv) {
  const MetricName cpu = cpu_spec().metric;
  const MetricName net = network_spec().metric;

  // Two workers: one idle from the start, one busy and then idle.
  {
    Harness h;
    setup(&h, test_config(false));
    h.fleet->members = {"i-a", "i-b"};
    h.backend->AddBatch(cpu, "i-a", {0.2, 0.1, 0.1});
    h.backend->AddBatch(cpu, "i-b", {0.9, 0.8, 0.7});
    h.backend->AddBatch(cpu, "i-b", {0.1, 0.1, 0.1});
    const std::string cpu_path = h.ctx.store->MetricPath(cpu);

    FleetController controller(&h.ctx);
    RunResult result = controller.Run();
    ControllerStatus status = controller.Status();
    if (result != RUN_DRAINED || h.fleet->terminated.size() != 2 ||
        h.fleet->terminated[0] != "i-a" || h.fleet->terminated[1] != "i-b") {
      FAIL("Reap an idle fleet");
      return 1;
    }
    if (status.running || status.cycles != 3 ||
        status.terminated.size() != 2 || !status.tracked.empty()) {
      FAIL("Status after draining");
      return 1;
    }
    if (count_lines(cpu_path) != 6) {
      FAIL("Every sample persisted");
      return 1;
    }
    PASS("Reap an idle fleet");
  }

  // The loop ends on the first empty listing.
  {
    Harness h;
    setup(&h, test_config(false));
    h.fleet->listings.push_back({"i-a"});
    h.fleet->listings.push_back({});
    FleetController controller(&h.ctx);
    if (controller.Run() != RUN_DRAINED || h.fleet->list_calls != 2 ||
        h.fleet->terminate_calls != 0) {
      FAIL("Stop when the fleet is empty");
      return 1;
    }
    PASS("Stop when the fleet is empty");
  }

  // A listing error is not an empty fleet.
  {
    Harness h;
    setup(&h, test_config(false));
    h.fleet->fail_list = true;
    FleetController controller(&h.ctx);
    CycleSummary summary;
    if (controller.RunCycle(&summary) != CYCLE_SKIPPED) {
      FAIL("Skip a cycle when listing fails");
      return 1;
    }
    h.fleet->fail_list = false;
    if (controller.RunCycle(&summary) != CYCLE_DRAINED) {
      FAIL("Drain after listing recovers");
      return 1;
    }
    PASS("Listing errors skip the cycle");
  }

  // A metric failing for one worker leaves the rest of the cycle alone.
  {
    Harness h;
    setup(&h, test_config(true));
    h.fleet->members = {"i-x", "i-y"};
    h.backend->AddBatch(cpu, "i-x", {0.9, 0.9, 0.9});
    h.backend->SetStatus(net, "i-x", FETCH_TRANSIENT);
    h.backend->AddBatch(cpu, "i-y", {0.9, 0.9, 0.9});
    h.backend->AddBatch(net, "i-y", {100, 200, 300});

    FleetController controller(&h.ctx);
    CycleSummary summary;
    if (controller.RunCycle(&summary) != CYCLE_DONE || summary.polled != 2 ||
        summary.skipped.size() != 1 || summary.backend_outage) {
      FAIL("Isolate a failing fetch");
      return 1;
    }
    if (h.ctx.store->NumSamples(cpu, "i-x") != 3 ||
        h.ctx.store->NumSamples(net, "i-y") != 3) {
      FAIL("Other fetches stored");
      return 1;
    }
    if (h.ctx.store->Watermark("i-x") != h.default_wm ||
        h.ctx.store->Watermark("i-y") <= h.default_wm) {
      FAIL("Watermark held back for the failing worker only");
      return 1;
    }
    if (h.sleeper->delays_s.size() != 3) {
      FAIL("Failing fetch retried");
      return 1;
    }
    PASS("Isolate a failing fetch");
  }

  // Each cycle fetches from the watermark up to now plus the lookahead.
  {
    Harness h;
    setup(&h, test_config(false));
    h.fleet->members = {"i-a"};
    h.backend->AddBatch(cpu, "i-a", {0.9, 0.9, 0.9});
    const int64_t newest = h.first_ts + 2 * cpu_spec().period_s;
    const int64_t lookahead = h.ctx.config.lookahead_s;

    FleetController controller(&h.ctx);
    CycleSummary summary;
    const int64_t before_first = get_curr_seconds();
    if (controller.RunCycle(&summary) != CYCLE_DONE ||
        h.backend->windows.size() != 1 ||
        h.backend->windows[0].first != h.default_wm ||
        h.backend->windows[0].second < before_first + lookahead) {
      FAIL("First window starts at the default watermark");
      return 1;
    }
    const int64_t before_second = get_curr_seconds();
    if (controller.RunCycle(&summary) != CYCLE_DONE ||
        h.backend->windows.size() != 2 ||
        h.backend->windows[1].first != newest ||
        h.backend->windows[1].second < before_second + lookahead) {
      FAIL("Second window starts at the newest stored sample");
      return 1;
    }
    // The second cycle returned nothing, so the start does not move.
    if (controller.RunCycle(&summary) != CYCLE_DONE ||
        h.backend->windows.size() != 3 ||
        h.backend->windows[2].first != newest) {
      FAIL("Empty fetch keeps the window start");
      return 1;
    }
    PASS("Fetch windows follow the watermark");
  }

  // No evaluation while every fetch fails.
  {
    Harness h;
    MonitorConfig config = test_config(false);
    config.retry.max_attempts = 1;
    setup(&h, config);
    h.fleet->members = {"i-x"};
    h.backend->SetStatus(cpu, "i-x", FETCH_TRANSIENT);
    FleetController controller(&h.ctx);
    CycleSummary summary;
    if (controller.RunCycle(&summary) != CYCLE_DONE ||
        !summary.backend_outage || summary.flagged != 0 ||
        h.fleet->terminate_calls != 0) {
      FAIL("Backend outage");
      return 1;
    }
    PASS("Backend outage");
  }

  // A failed termination keeps the worker and does not block others.
  {
    Harness h;
    setup(&h, test_config(false));
    h.fleet->members = {"i-x", "i-y"};
    h.fleet->fail_terminate = {"i-x"};
    h.backend->AddBatch(cpu, "i-x", {0.1, 0.1, 0.1});
    h.backend->AddBatch(cpu, "i-x", {0.1});
    h.backend->AddBatch(cpu, "i-y", {0.1, 0.1, 0.1});

    FleetController controller(&h.ctx);
    CycleSummary summary;
    controller.RunCycle(&summary);
    ControllerStatus status = controller.Status();
    if (summary.flagged != 2 || summary.terminated != 1 ||
        status.tracked.size() != 1 || status.tracked[0] != "i-x" ||
        status.terminated.size() != 1 || status.terminated[0] != "i-y") {
      FAIL("Isolate a failed termination");
      return 1;
    }

    h.fleet->fail_terminate.clear();
    controller.RunCycle(&summary);
    if (summary.terminated != 1 || h.fleet->terminated.size() != 2 ||
        h.fleet->terminated[1] != "i-x") {
      FAIL("Retry termination next cycle");
      return 1;
    }
    if (controller.RunCycle(&summary) != CYCLE_DRAINED) {
      FAIL("Drain after retried termination");
      return 1;
    }
    PASS("Isolate a failed termination");
  }

  // A worker without telemetry is dropped and never tracked again.
  {
    Harness h;
    setup(&h, test_config(false));
    h.fleet->members = {"i-a", "i-gone"};
    h.backend->SetStatus(cpu, "i-gone", FETCH_NOT_FOUND);
    h.backend->AddBatch(cpu, "i-a", {0.9, 0.9, 0.9});
    FleetController controller(&h.ctx);
    CycleSummary summary;
    controller.RunCycle(&summary);
    if (summary.dropped != 1 || controller.Status().tracked.size() != 1) {
      FAIL("Drop a vanished worker");
      return 1;
    }
    controller.RunCycle(&summary);
    if (summary.polled != 1) {
      FAIL("Vanished worker stays untracked");
      return 1;
    }
    PASS("Drop a vanished worker");
  }

  // Cycles are paced at the configured interval.
  {
    Harness h;
    MonitorConfig config = test_config(false);
    config.interval_s = 3600;
    setup(&h, config);
    h.fleet->listings.push_back({"i-a"});
    h.fleet->listings.push_back({"i-a"});
    h.fleet->listings.push_back({});
    FleetController controller(&h.ctx);
    if (controller.Run() != RUN_DRAINED || h.sleeper->delays_s.size() != 3 ||
        h.sleeper->delays_s[0] != 0 || h.sleeper->delays_s[1] < 3590 ||
        h.sleeper->delays_s[1] > 3600) {
      FAIL("Pace cycles");
      return 1;
    }
    PASS("Pace cycles");
  }

  // The watchdog alarm is put once per worker and removed on retirement.
  {
    Harness h;
    setup(&h, test_config(false));
    FakeGate* gate = new FakeGate();
    h.ctx.gate.reset(gate);
    h.ctx.config.alarm.enabled = true;
    h.fleet->members = {"i-a", "i-b"};
    h.backend->AddBatch(cpu, "i-a", {0.9, 0.9, 0.9});
    h.backend->AddBatch(cpu, "i-b", {0.1, 0.1, 0.1});
    FleetController controller(&h.ctx);
    CycleSummary summary;
    controller.RunCycle(&summary);
    controller.RunCycle(&summary);
    if (gate->put_calls != 2 || gate->alarmed.size() != 1 ||
        !gate->alarmed.count("i-a") ||
        gate->last_action != TerminateActionArn(h.ctx.config.region)) {
      FAIL("Watchdog alarms");
      return 1;
    }
    PASS("Watchdog alarms");
  }

  // Stop() during the warm-up ends the run before any cycle.
  {
    Harness h;
    MonitorConfig config = test_config(false);
    config.warmup_s = 900;
    setup(&h, config);
    h.fleet->members = {"i-a"};
    FleetController controller(&h.ctx);
    controller.Stop();
    if (controller.Run() != RUN_CANCELLED || h.fleet->list_calls != 0 ||
        h.sleeper->delays_s.size() != 1 || h.sleeper->delays_s[0] != 900) {
      FAIL("Cancel during warm-up");
      return 1;
    }
    PASS("Cancel during warm-up");
  }

  // Stop() wakes a loop that is really sleeping.
  {
    Harness h;
    MonitorConfig config = test_config(false);
    config.warmup_s = 3600;
    setup(&h, config, true);
    h.fleet->members = {"i-a"};
    FleetController controller(&h.ctx);
    RunResult result = RUN_DRAINED;
    auto start = std::chrono::steady_clock::now();
    std::thread runner([&]() { result = controller.Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    controller.Stop();
    runner.join();
    auto waited = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start);
    if (result != RUN_CANCELLED || waited.count() > 5) {
      FAIL("Stop a sleeping loop");
      return 1;
    }
    PASS("Stop a sleeping loop");
  }

  // Failing to persist samples ends the run with PersistenceError.
  {
    const std::string blocker = make_temp_dir() + "/not_a_dir";
    {
      std::ofstream touch(blocker);
      touch << "x" << std::endl;
    }
    Harness h;
    setup(&h, test_config(false), false, blocker + "/run");
    h.fleet->members = {"i-a"};
    h.backend->AddBatch(cpu, "i-a", {0.1, 0.1, 0.1});
    FleetController controller(&h.ctx);
    bool threw = false;
    try {
      controller.Run();
    } catch (const PersistenceError& e) {
      threw = true;
    }
    if (!threw || controller.Status().running ||
        h.fleet->terminate_calls != 0) {
      FAIL("Persistence error is fatal");
      return 1;
    }
    PASS("Persistence error is fatal");
  }

  // Any failure that ends the loop is reported, not thrown, by RunToEnd.
  {
    Harness h;
    MonitorConfig config = test_config(true);
    setup(&h, config);
    // The store knows only the CPU metric, so storing NetworkIn fails.
    std::vector<MetricSpec> cpu_only(1, cpu_spec());
    h.ctx.store.reset(new MetricStore(make_temp_dir() + "/run", cpu_only,
                                      h.default_wm));
    h.ctx.store->Recover();
    h.fleet->members = {"i-a"};
    h.backend->AddBatch(cpu, "i-a", {0.9});
    h.backend->AddBatch(net, "i-a", {100});
    FleetController controller(&h.ctx);
    RunResult result = RUN_DRAINED;
    if (controller.RunToEnd(&result) != -1 || result != RUN_CANCELLED ||
        controller.Status().running) {
      FAIL("Report a failed loop");
      return 1;
    }

    Harness drained;
    setup(&drained, test_config(false));
    FleetController done(&drained.ctx);
    if (done.RunToEnd(&result) != 0 || result != RUN_DRAINED) {
      FAIL("Report a drained loop");
      return 1;
    }
    PASS("Report how the loop ended");
  }

  return 0;
}
