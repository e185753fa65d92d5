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

// The only place the monitor loop suspends. Stop() wakes every sleeper
// immediately and makes all later sleeps return at once.
#ifndef CANCELLABLE_SLEEPER_H
#define CANCELLABLE_SLEEPER_H

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace idlereaper {
namespace internal {

class CancellableSleeper {
public:
  CancellableSleeper() : stopped_(false) {}
  virtual ~CancellableSleeper() {}

  // Sleep for duration. Return true if the full duration elapsed, false if
  // Stop() was called before or during the wait.
  virtual bool SleepFor(const std::chrono::milliseconds& duration);

  void Stop();
  bool Stopped() const;

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_;
};

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef CANCELLABLE_SLEEPER_H
