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
#include <stdexcept>
#include <string>
#include <vector>

#include "idleness_evaluator.h"

namespace idlereaper {
namespace internal {

IdlenessEvaluator::IdlenessEvaluator(size_t window, double threshold)
    : window_(window), threshold_(threshold) {
  if (window_ == 0) {
    throw std::invalid_argument("Idle window must hold at least one sample");
  }
  if (!(threshold_ >= 0.0 && threshold_ <= 100.0)) {
    throw std::invalid_argument("Idle threshold must be a percentage: " +
                                std::to_string(threshold_));
  }
}

bool IdlenessEvaluator::IsIdle(const std::vector<double>& values) const {
  if (values.size() < window_) { return false; }
  double peak = *std::max_element(values.end() - window_, values.end());
  return peak < threshold_;
}

}  // namespace internal
}  // namespace idlereaper
