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

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "metric_store.h"
#include "test_fakes.h"

#define FAIL(x) printf("[FAIL]: " #x "\n")
#define PASS(x) printf("[PASS]: " #x "\n")

using namespace idlereaper::internal;

static const int64_t base_ts = 1452819900;  // 2016-01-15T01:05:00Z
static const int64_t default_wm = base_ts - 1800;

static MetricSpec make_spec(const std::string& ns, const std::string& name,
                            const std::string& unit) {
  MetricSpec spec;
  spec.metric.ns = ns;
  spec.metric.name = name;
  spec.unit = unit;
  spec.statistic = "Average";
  spec.period_s = 300;
  return spec;
}

static std::vector<Sample> make_samples(const std::string& instance,
                                        const std::vector<double>& values,
                                        int64_t first_ts) {
  std::vector<Sample> samples;
  for (size_t i = 0; i < values.size(); ++i) {
    Sample s = {instance, values[i], first_ts + (int64_t)i * 300};
    samples.push_back(s);
  }
  return samples;
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
  const MetricSpec cpu = make_spec("AWS/EC2", "CPUUtilization", "Percent");
  const MetricSpec net = make_spec("AWS/EC2", "NetworkIn", "Bytes");
  std::vector<MetricSpec> metrics = {cpu, net};
  const std::string run_dir =
      make_temp_dir() + "/" + MetricStore::RunDirName("run1", base_ts);

  if (MetricStore::RunDirName("run1", base_ts) != "run1_2016-01-15") {
    FAIL("Run directory name");
    return 1;
  }
  PASS("Run directory name");

  MetricStore store(run_dir, metrics, default_wm);
  store.Recover();

  // Appending the same batch twice keeps one copy in memory and on disk.
  std::vector<Sample> batch = make_samples("i-a", {0.2, 0.1, 0.3}, base_ts);
  size_t added = store.Append(cpu.metric, "i-a", batch);
  size_t again = store.Append(cpu.metric, "i-a", batch);
  if (added != 3 || again != 0 ||
      store.NumSamples(cpu.metric, "i-a") != 3 ||
      count_lines(store.MetricPath(cpu.metric)) != 3) {
    FAIL("Idempotent append");
    return 1;
  }
  PASS("Idempotent append");

  // Overlapping batch: only the new timestamp is written.
  std::vector<Sample> overlap =
      make_samples("i-a", {0.3, 0.4}, base_ts + 600);
  if (store.Append(cpu.metric, "i-a", overlap) != 1 ||
      count_lines(store.MetricPath(cpu.metric)) != 4) {
    FAIL("Overlapping append");
    return 1;
  }
  PASS("Overlapping append");

  std::vector<double> recent = store.RecentValues(cpu.metric, "i-a", 3);
  if (recent.size() != 3 || recent[0] != 0.1 || recent[2] != 0.4) {
    FAIL("Recent values in timestamp order");
    return 1;
  }
  if (store.RecentValues(cpu.metric, "i-b", 3).size() != 0) {
    FAIL("Recent values of an unknown instance");
    return 1;
  }
  PASS("Recent values");

  std::ifstream cpu_file(store.MetricPath(cpu.metric));
  std::string first_row;
  std::getline(cpu_file, first_row);
  if (first_row != "i-a\t0.2\t2016-01-15T01:05:00Z") {
    FAIL("Row format");
    std::cout << first_row << std::endl;
    return 1;
  }
  PASS("Row format");

  // Watermarks
  if (store.Watermark("i-a") != default_wm) {
    FAIL("Default watermark");
    return 1;
  }
  store.AdvanceWatermark("i-a", base_ts + 900);
  store.AdvanceWatermark("i-a", base_ts);
  if (store.Watermark("i-a") != base_ts + 900) {
    FAIL("Monotonic watermark");
    return 1;
  }
  store.AdvanceWatermark("i-b", default_wm - 100);
  if (store.Watermark("i-b") != default_wm) {
    FAIL("Watermark never below the default");
    return 1;
  }
  PASS("Watermarks");

  // Recovery: i-a has CPU up to base_ts + 900 and NetworkIn up to
  // base_ts + 300, so it resumes from the lagging metric.
  store.Append(net.metric, "i-a", make_samples("i-a", {10, 20}, base_ts));
  {
    std::ofstream bad(store.MetricPath(net.metric), std::ios::app);
    bad << "garbage line" << std::endl;
  }
  MetricStore reopened(run_dir, metrics, default_wm);
  reopened.Recover();
  if (reopened.NumSamples(cpu.metric, "i-a") != 4 ||
      reopened.NumSamples(net.metric, "i-a") != 2) {
    FAIL("Recover rows");
    return 1;
  }
  if (reopened.Watermark("i-a") != base_ts + 300) {
    FAIL("Recover watermark");
    std::cout << reopened.Watermark("i-a") << std::endl;
    return 1;
  }
  if (reopened.Append(cpu.metric, "i-a", batch) != 0 ||
      count_lines(reopened.MetricPath(cpu.metric)) != 4) {
    FAIL("Recovered store deduplicates");
    return 1;
  }
  PASS("Recovery");

  reopened.Forget("i-a");
  if (reopened.NumSamples(cpu.metric, "i-a") != 0 ||
      reopened.Watermark("i-a") != default_wm) {
    FAIL("Forget an instance");
    return 1;
  }
  PASS("Forget an instance");

  // A crash in the middle of a row leaves a fragment without a newline.
  // Rows appended after the restart must survive the next restart.
  {
    const std::string torn_dir = make_temp_dir() + "/torn";
    MetricStore first(torn_dir, metrics, default_wm);
    first.Recover();
    first.Append(cpu.metric, "i-a", make_samples("i-a", {1}, base_ts));
    {
      std::ofstream torn(first.MetricPath(cpu.metric), std::ios::app);
      torn << "i-a\t2.";
    }
    MetricStore second(torn_dir, metrics, default_wm);
    second.Recover();
    if (second.Append(cpu.metric, "i-a",
                      make_samples("i-a", {3, 4}, base_ts + 600)) != 2) {
      FAIL("Append after a torn row");
      return 1;
    }
    MetricStore third(torn_dir, metrics, default_wm);
    third.Recover();
    std::vector<double> values = third.RecentValues(cpu.metric, "i-a", 3);
    if (third.NumSamples(cpu.metric, "i-a") != 3 || values.size() != 3 ||
        values[0] != 1 || values[1] != 3 || values[2] != 4 ||
        third.Watermark("i-a") != base_ts + 900) {
      FAIL("Rows after a torn row survive recovery");
      std::cout << third.NumSamples(cpu.metric, "i-a") << " samples"
                << std::endl;
      return 1;
    }
    PASS("Recover after a torn row");
  }

  // A run directory below a regular file cannot be created or written.
  const std::string blocker = make_temp_dir() + "/not_a_dir";
  {
    std::ofstream touch(blocker);
    touch << "x" << std::endl;
  }
  MetricStore broken(blocker + "/run", metrics, default_wm);
  bool threw = false;
  try {
    broken.Recover();
  } catch (const PersistenceError& e) {
    threw = true;
  }
  if (!threw) {
    FAIL("Recover raises PersistenceError");
    return 1;
  }
  threw = false;
  try {
    broken.Append(cpu.metric, "i-a", batch);
  } catch (const PersistenceError& e) {
    threw = true;
  }
  if (!threw || broken.NumSamples(cpu.metric, "i-a") != 0) {
    FAIL("Append raises PersistenceError");
    return 1;
  }
  PASS("Persistence errors");

  return 0;
}
