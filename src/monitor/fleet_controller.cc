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

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "fleet_controller.h"

namespace idlereaper {
namespace internal {
namespace {

double seconds_since(const std::chrono::steady_clock::time_point& start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
             .count() /
         1000.0;
}

CycleSummary empty_summary(int64_t cycle) {
  CycleSummary summary;
  summary.cycle = cycle;
  summary.polled = 0;
  summary.flagged = 0;
  summary.terminated = 0;
  summary.dropped = 0;
  summary.backend_outage = false;
  summary.elapsed_s = 0.0;
  return summary;
}

}  // namespace

FleetController::FleetController(MonitorContext* ctx)
    : ctx_(ctx),
      evaluator_((size_t)std::max<int16_t>(ctx->config.idle_window, 0),
                 ctx->config.idle_threshold),
      cycle_(0) {
  status_.running = false;
  status_.cycles = 0;
  status_.last_cycle = empty_summary(0);
}

void FleetController::Stop() {
  std::cout << "[FleetController] Stop requested" << std::endl;
  ctx_->sleeper->Stop();
}

ControllerStatus FleetController::Status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

void FleetController::SetRunning(bool running) {
  std::lock_guard<std::mutex> lock(status_mutex_);
  status_.running = running;
}

RunResult FleetController::Run() {
  SetRunning(true);
  RunResult result;
  try {
    result = Loop();
  } catch (...) {
    SetRunning(false);
    throw;
  }
  SetRunning(false);
  return result;
}

int8_t FleetController::RunToEnd(RunResult* result) {
  *result = RUN_CANCELLED;
  try {
    *result = Run();
  } catch (const PersistenceError& e) {
    std::cerr << "[FleetController] Fatal: " << e.what() << std::endl;
    return -1;
  } catch (const std::exception& e) {
    std::cerr << "[FleetController] Monitor loop failed: " << e.what()
              << std::endl;
    return -1;
  }
  return 0;
}

RunResult FleetController::Loop() {
  const MonitorConfig& config = ctx_->config;
  std::cout << "[FleetController] Monitoring cluster " << config.cluster
            << ". Waiting " << config.warmup_s
            << " seconds before initial collection." << std::endl;
  if (!ctx_->sleeper->SleepFor(std::chrono::seconds(config.warmup_s))) {
    std::cout << "[FleetController] Cancelled during warm-up" << std::endl;
    return RUN_CANCELLED;
  }

  const std::chrono::milliseconds interval =
      std::chrono::seconds(config.interval_s);
  while (true) {
    if (ctx_->sleeper->Stopped()) { return RUN_CANCELLED; }
    auto cycle_start = std::chrono::steady_clock::now();

    CycleSummary summary;
    CycleOutcome outcome = RunCycle(&summary);
    if (outcome == CYCLE_DRAINED) {
      std::cout << "[FleetController] Fleet drained after " << cycle_
                << " cycles" << std::endl;
      return RUN_DRAINED;
    }
    if (outcome == CYCLE_CANCELLED || ctx_->sleeper->Stopped()) {
      std::cout << "[FleetController] Cancelled in cycle " << cycle_
                << std::endl;
      return RUN_CANCELLED;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - cycle_start);
    if (elapsed >= interval) {
      if (interval.count() > 0) {
        std::cout << "[LOG]: WARNING: cycle " << cycle_ << " took "
                  << elapsed.count() / 1000.0 << " seconds, more than the "
                  << config.interval_s
                  << " second interval. Starting the next cycle now."
                  << std::endl;
      }
      continue;
    }
    std::cout << "[LOG]: Sleeping " << (interval - elapsed).count() / 1000.0
              << " seconds until the next collection" << std::endl;
    std::cout << "===============================================" << std::endl;
    if (!ctx_->sleeper->SleepFor(interval - elapsed)) {
      std::cout << "[FleetController] Cancelled while sleeping" << std::endl;
      return RUN_CANCELLED;
    }
  }
}

CycleOutcome FleetController::RunCycle(CycleSummary* summary) {
  const MonitorConfig& config = ctx_->config;
  auto cycle_start = std::chrono::steady_clock::now();
  ++cycle_;
  *summary = empty_summary(cycle_);
  std::cout << "[LOG]: Cycle " << cycle_ << " started at "
            << FormatTimestamp(get_curr_seconds()) << std::endl;

  // Enumerate
  std::vector<std::string> listed;
  if (ctx_->fleet->ListWorkers(config.cluster, &listed) != 0) {
    std::cerr << "[FleetController] Failed to list workers of "
              << config.cluster << ", skipping cycle " << cycle_ << std::endl;
    summary->elapsed_s = seconds_since(cycle_start);
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.cycles = cycle_;
    status_.last_cycle = *summary;
    return CYCLE_SKIPPED;
  }

  std::set<std::string> seen;
  std::vector<std::string> live;
  for (const std::string& id : listed) {
    if (retired_.count(id) || !seen.insert(id).second) { continue; }
    live.push_back(id);
  }
  if (live.empty()) {
    std::cout << "[LOG]: No live workers left in " << config.cluster
              << std::endl;
    summary->elapsed_s = seconds_since(cycle_start);
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_.cycles = cycle_;
    status_.tracked.clear();
    status_.last_cycle = *summary;
    return CYCLE_DRAINED;
  }
  summary->polled = live.size();

  if (ctx_->gate) { ApplyAlarms(live); }

  // Collect
  int64_t window_end = get_curr_seconds() + config.lookahead_s;
  std::vector<InstanceResult> results;
  Collect(live, window_end, &results);
  if (ctx_->sleeper->Stopped()) { return CYCLE_CANCELLED; }

  size_t attempted = 0, transient = 0;
  for (const InstanceResult& r : results) {
    attempted += r.attempted;
    transient += r.transient;
    for (const std::string& s : r.skipped) {
      summary->skipped.push_back(r.instance + " " + s);
    }
  }
  summary->backend_outage = (attempted > 0) && (transient == attempted);

  // Evaluate
  std::vector<std::string> flagged;
  if (summary->backend_outage) {
    std::cerr << "[FleetController] Every fetch of cycle " << cycle_
              << " failed transiently, skipping evaluation" << std::endl;
  } else {
    for (const InstanceResult& r : results) {
      if (r.not_found || !r.idle_metric_fresh) { continue; }
      std::vector<double> recent = ctx_->store->RecentValues(
          config.idle_metric, r.instance, evaluator_.window());
      bool idle = evaluator_.IsIdle(recent);
      std::cout << "[LOG]: " << r.instance << " recent "
                << config.idle_metric.name << ":";
      for (double v : recent) { std::cout << " " << v; }
      std::cout << (idle ? " => idle" : " => active") << std::endl;
      if (idle) { flagged.push_back(r.instance); }
    }
  }
  summary->flagged = flagged.size();

  // Act
  std::set<std::string> removed;
  for (const InstanceResult& r : results) {
    if (!r.not_found) { continue; }
    std::cout << "[LOG]: " << r.instance
              << " no longer exists, removing it from tracking" << std::endl;
    removed.insert(r.instance);
    summary->dropped++;
  }
  std::vector<std::string> terminated_now;
  for (const std::string& victim : flagged) {
    std::cout << "[LOG]: Terminating idle instance " << victim << std::endl;
    if (ctx_->fleet->TerminateInstances(std::vector<std::string>(1, victim))) {
      std::cerr << "[FleetController] Failed to terminate " << victim
                << ", will retry next cycle if it is still idle" << std::endl;
      continue;
    }
    removed.insert(victim);
    terminated_now.push_back(victim);
    summary->terminated++;
  }

  // The next tracked set is this cycle's live set minus what left it.
  std::vector<std::string> tracked;
  for (const std::string& id : live) {
    if (!removed.count(id)) { tracked.push_back(id); }
  }
  for (const std::string& id : removed) { Retire(id); }

  summary->elapsed_s = seconds_since(cycle_start);
  LogSummary(*summary);

  std::lock_guard<std::mutex> lock(status_mutex_);
  status_.cycles = cycle_;
  status_.tracked = tracked;
  status_.terminated.insert(status_.terminated.end(), terminated_now.begin(),
                            terminated_now.end());
  status_.last_cycle = *summary;
  return CYCLE_DONE;
}

void FleetController::Collect(const std::vector<std::string>& instances,
                              int64_t window_end,
                              std::vector<InstanceResult>* results) {
  results->clear();
  for (const std::string& id : instances) {
    InstanceResult r;
    r.instance = id;
    r.not_found = false;
    r.idle_metric_fresh = false;
    r.attempted = 0;
    r.transient = 0;
    results->push_back(r);
  }

  // Instances are spread over the pool; the metrics of one instance are
  // fetched by one worker, so every (metric, instance) log has one writer.
  std::atomic<size_t> next(0);
  std::mutex error_mutex;
  std::exception_ptr error;
  auto worker = [&]() {
    while (true) {
      size_t i = next.fetch_add(1);
      if (i >= instances.size() || ctx_->sleeper->Stopped()) { return; }
      {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (error) { return; }
      }
      try {
        CollectInstance(instances[i], window_end, &(*results)[i]);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!error) { error = std::current_exception(); }
        return;
      }
    }
  };

  size_t num_workers = std::min(
      (size_t)std::max<int16_t>(ctx_->config.fetch_workers, 1),
      instances.size());
  std::vector<std::thread> pool;
  for (size_t i = 0; i < num_workers; ++i) { pool.emplace_back(worker); }
  for (auto& t : pool) { t.join(); }

  if (error) { std::rethrow_exception(error); }
}

void FleetController::CollectInstance(const std::string& instance,
                                      int64_t window_end,
                                      InstanceResult* result) {
  const MonitorConfig& config = ctx_->config;
  const int64_t window_start = ctx_->store->Watermark(instance);
  int64_t latest = window_start;
  bool complete = true;

  for (const MetricSpec& spec : config.metrics) {
    if (ctx_->sleeper->Stopped()) { return; }
    std::vector<Sample> samples;
    std::string reason;
    result->attempted++;
    FetchStatus status = ctx_->client->Fetch(spec, instance, window_start,
                                             window_end, &samples, &reason);
    if (status == FETCH_NOT_FOUND) {
      result->not_found = true;
      return;
    }
    if (status != FETCH_OK) {
      if (status == FETCH_TRANSIENT) { result->transient++; }
      complete = false;
      result->skipped.push_back(spec.metric.Key() + ": " +
                                FetchStatusName(status) + ", " + reason);
      continue;
    }

    size_t added = ctx_->store->Append(spec.metric, instance, samples);
    for (const Sample& s : samples) { latest = std::max(latest, s.timestamp); }
    if (spec.metric == config.idle_metric && added > 0) {
      result->idle_metric_fresh = true;
    }
  }

  // A skipped metric keeps the watermark where it was, so its window is
  // fetched again next cycle. Samples already stored are deduplicated.
  if (complete && latest > window_start) {
    ctx_->store->AdvanceWatermark(instance, latest);
  }
}

void FleetController::ApplyAlarms(const std::vector<std::string>& instances) {
  const MonitorConfig& config = ctx_->config;
  const MetricSpec* spec = FindMetric(config, config.idle_metric);
  if (spec == NULL) { return; }
  const std::string action = config.alarm.action.empty()
                                 ? TerminateActionArn(config.region)
                                 : config.alarm.action;
  for (const std::string& id : instances) {
    if (alarmed_.count(id)) { continue; }
    if (ctx_->gate->PutAlarm(id, *spec, config.alarm.threshold, action)) {
      std::cerr << "[FleetController] Failed to put watchdog alarm on " << id
                << ", retrying next cycle" << std::endl;
      continue;
    }
    alarmed_.insert(id);
  }
}

void FleetController::Retire(const std::string& instance) {
  retired_.insert(instance);
  ctx_->store->Forget(instance);
  if (alarmed_.erase(instance) && ctx_->gate) {
    if (ctx_->gate->DeleteAlarm(instance)) {
      std::cerr << "[FleetController] Failed to delete watchdog alarm of "
                << instance << std::endl;
    }
  }
}

void FleetController::LogSummary(const CycleSummary& summary) const {
  std::cout << "[LOG]: cycle=" << summary.cycle << " polled=" << summary.polled
            << " flagged=" << summary.flagged
            << " terminated=" << summary.terminated
            << " dropped=" << summary.dropped
            << " skipped=" << summary.skipped.size()
            << " backend_outage=" << (summary.backend_outage ? 1 : 0)
            << " elapsed_s=" << summary.elapsed_s << std::endl;
  for (const std::string& s : summary.skipped) {
    std::cout << "[LOG]: skipped " << s << std::endl;
  }
}

}  // namespace internal
}  // namespace idlereaper
