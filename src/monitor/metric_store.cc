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

#include <errno.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "include/constants.h"
#include "metric_store.h"

namespace idlereaper {
namespace internal {
namespace {

inline bool file_exist(const std::string& path) {
  struct stat buffer;
  return (stat(path.c_str(), &buffer) == 0);
}

inline bool is_dir(const std::string& path) {
  struct stat buffer;
  return (stat(path.c_str(), &buffer) == 0) && S_ISDIR(buffer.st_mode);
}

// Create a directory recursively. Return 0 on success, -1 on error.
int create_dir(const std::string& inp_path) {
  std::string path = inp_path;
  while (path.size() > 1 && path.back() == '/') { path.pop_back(); }
  if (path.empty() || is_dir(path)) { return 0; }
  auto slash = path.rfind("/");
  if (slash != std::string::npos && slash > 0) {
    std::string parent_dir = path.substr(0, slash);
    if (!is_dir(parent_dir) && create_dir(parent_dir)) { return -1; }
  }
  if (mkdir(path.c_str(), S_IRWXU | S_IRWXG | S_IROTH | S_IXOTH) &&
      errno != EEXIST) {
    return -1;
  }
  return is_dir(path) ? 0 : -1;
}

// A row torn by a crash has no trailing newline. Close it so the next
// appended row starts on its own line.
void TerminateLastRow(const std::string& path) {
  std::ifstream infile(path, std::ios::in | std::ios::binary);
  if (!infile.is_open()) {
    throw PersistenceError("Failed to open " + path + " for recovery");
  }
  infile.seekg(0, std::ios::end);
  if (infile.tellg() <= 0) { return; }
  infile.seekg(-1, std::ios::end);
  char last = '\n';
  if (!infile.get(last)) { throw PersistenceError("Failed to read " + path); }
  infile.close();
  if (last == '\n') { return; }

  std::ofstream outfile(path, std::ios::out | std::ios::app);
  outfile << "\n";
  outfile.flush();
  if (!outfile.good()) { throw PersistenceError("Failed to write " + path); }
  std::cout << "[MetricStore] Closed a partial row at the end of " << path
            << std::endl;
}

}  // namespace

MetricStore::MetricStore(const std::string& run_dir,
                         const std::vector<MetricSpec>& metrics,
                         int64_t default_watermark)
    : run_dir_(run_dir), default_watermark_(default_watermark) {
  for (const MetricSpec& spec : metrics) {
    paths_[spec.metric.Key()] =
        run_dir_ + "/" + spec.metric.name + metric_file_suffix;
  }
}

std::string MetricStore::RunDirName(const std::string& run_id,
                                    int64_t timestamp) {
  return run_id + "_" + FormatDate(timestamp);
}

std::string MetricStore::MetricPath(const MetricName& metric) const {
  auto it = paths_.find(metric.Key());
  if (it == paths_.end()) {
    throw std::invalid_argument("Untracked metric: " + metric.Key());
  }
  return it->second;
}

void MetricStore::Recover() {
  if (create_dir(run_dir_)) {
    throw PersistenceError("Failed to create run directory " + run_dir_ +
                           ": " + strerror(errno));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // Per instance, the earliest of the per-metric latest timestamps, so that
  // a metric that lagged behind before the restart is fetched again.
  std::map<std::string, int64_t> resume;
  for (const auto& kv : paths_) {
    std::map<std::string, int64_t> latest;
    auto slash = kv.first.rfind('/');
    MetricName metric = {kv.first.substr(0, slash),
                         kv.first.substr(slash + 1)};
    RecoverFile(metric, &latest);
    for (const auto& il : latest) {
      auto it = resume.find(il.first);
      if (it == resume.end() || il.second < it->second) {
        resume[il.first] = il.second;
      }
    }
  }
  for (const auto& ir : resume) {
    int64_t& wm = watermarks_[ir.first];
    wm = std::max(std::max(wm, default_watermark_), ir.second);
  }
}

void MetricStore::RecoverFile(const MetricName& metric,
                              std::map<std::string, int64_t>* latest) {
  const std::string& path = paths_[metric.Key()];
  if (!file_exist(path)) { return; }
  std::ifstream infile(path);
  if (!infile.is_open()) {
    throw PersistenceError("Failed to open " + path + " for recovery");
  }

  std::string line;
  size_t num_rows = 0, num_bad = 0;
  auto& by_instance = logs_[metric.Key()];
  while (std::getline(infile, line)) {
    if (line.empty()) { continue; }
    std::istringstream ss(line);
    std::string instance, value_str, ts_str;
    std::getline(ss, instance, '\t');
    std::getline(ss, value_str, '\t');
    std::getline(ss, ts_str, '\t');
    int64_t ts = 0;
    double value = 0.0;
    bool ok = !instance.empty() && (ParseTimestamp(ts_str, &ts) == 0);
    if (ok) {
      try {
        value = std::stod(value_str);
      } catch (const std::exception& e) {
        ok = false;
      }
    }
    if (!ok) {
      num_bad++;
      continue;
    }
    by_instance[instance].insert(std::make_pair(ts, value));
    auto it = latest->find(instance);
    if (it == latest->end() || ts > it->second) { (*latest)[instance] = ts; }
    num_rows++;
  }
  if (infile.bad()) { throw PersistenceError("Failed to read " + path); }
  infile.close();
  TerminateLastRow(path);

  std::cout << "[MetricStore] Recovered " << num_rows << " rows from " << path;
  if (num_bad) { std::cout << " (skipped " << num_bad << " malformed rows)"; }
  std::cout << std::endl;
}

size_t MetricStore::Append(const MetricName& metric,
                           const std::string& instance,
                           const std::vector<Sample>& samples) {
  const std::string path = MetricPath(metric);
  std::lock_guard<std::mutex> lock(mutex_);
  SampleLog& log = logs_[metric.Key()][instance];

  std::vector<Sample> accepted;
  SampleLog batch;
  for (const Sample& s : samples) {
    if (log.count(s.timestamp) || batch.count(s.timestamp)) { continue; }
    batch.insert(std::make_pair(s.timestamp, s.value));
    accepted.push_back(s);
  }
  if (accepted.empty()) { return 0; }
  std::stable_sort(accepted.begin(), accepted.end(), SampleBefore);

  std::ofstream outfile(path, std::ios::out | std::ios::app);
  if (!outfile.is_open()) {
    throw PersistenceError("Failed to open " + path + ": " + strerror(errno));
  }
  outfile << std::setprecision(12);
  for (const Sample& s : accepted) {
    outfile << instance << "\t" << s.value << "\t"
            << FormatTimestamp(s.timestamp) << "\n";
  }
  outfile.flush();
  if (!outfile.good()) { throw PersistenceError("Failed to write " + path); }

  log.insert(batch.begin(), batch.end());
  return accepted.size();
}

int64_t MetricStore::Watermark(const std::string& instance) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = watermarks_.find(instance);
  if (it == watermarks_.end()) { return default_watermark_; }
  return it->second;
}

void MetricStore::AdvanceWatermark(const std::string& instance,
                                   int64_t timestamp) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = watermarks_.find(instance);
  if (it == watermarks_.end()) {
    watermarks_[instance] = std::max(default_watermark_, timestamp);
  } else if (timestamp > it->second) {
    it->second = timestamp;
  }
}

std::vector<double> MetricStore::RecentValues(const MetricName& metric,
                                              const std::string& instance,
                                              size_t n) const {
  std::vector<double> values;
  std::lock_guard<std::mutex> lock(mutex_);
  auto mit = logs_.find(metric.Key());
  if (mit == logs_.end()) { return values; }
  auto iit = mit->second.find(instance);
  if (iit == mit->second.end()) { return values; }

  const SampleLog& log = iit->second;
  size_t skip = log.size() > n ? log.size() - n : 0;
  auto it = log.begin();
  std::advance(it, skip);
  for (; it != log.end(); ++it) { values.push_back(it->second); }
  return values;
}

size_t MetricStore::NumSamples(const MetricName& metric,
                               const std::string& instance) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto mit = logs_.find(metric.Key());
  if (mit == logs_.end()) { return 0; }
  auto iit = mit->second.find(instance);
  return iit == mit->second.end() ? 0 : iit->second.size();
}

void MetricStore::Forget(const std::string& instance) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& kv : logs_) { kv.second.erase(instance); }
  watermarks_.erase(instance);
}

}  // namespace internal
}  // namespace idlereaper
