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

#ifndef IDLENESS_EVALUATOR_H
#define IDLENESS_EVALUATOR_H

#include <cstddef>
#include <vector>

namespace idlereaper {
namespace internal {

// An instance is idle when each of its last `window` utilization values is
// below `threshold` (percent, 0-100). With fewer than `window` values it is
// never idle.
class IdlenessEvaluator {
public:
  // Throws std::invalid_argument if window is 0 or threshold is outside
  // [0, 100].
  IdlenessEvaluator(size_t window, double threshold);

  bool IsIdle(const std::vector<double>& values) const;

  size_t window() const { return window_; }
  double threshold() const { return threshold_; }

private:
  size_t window_;
  double threshold_;
};

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef IDLENESS_EVALUATOR_H
