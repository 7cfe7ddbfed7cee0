#pragma once

#include <cmath>
#include <cstddef>

namespace tsforest::transform::core::univariate {

  /// Arithmetic mean of data[0 .. length[
  /// Requires length > 0
  template<typename F>
  F mean(F const *data, size_t length) {
    F acc{0};
    for (size_t i = 0; i<length; ++i) { acc += data[i]; }
    return acc/(F)length;
  }

  /// Population standard deviation (normalised by N) of data[0 .. length[ given its mean
  /// Requires length > 0. A single point has a standard deviation of 0.
  template<typename F>
  F stddev(F const *data, size_t length, F mean) {
    F acc{0};
    for (size_t i = 0; i<length; ++i) {
      F d = data[i] - mean;
      acc += d*d;
    }
    return std::sqrt(acc/(F)length);
  }

  /// Least squares slope of data[0 .. length[ against its index 0 .. length-1
  ///
  ///     sum (x - xm)(y - ym)
  ///     --------------------
  ///       sum (x - xm)^2
  ///
  /// Requires length > 0. Less than two points have no trend: return 0.
  template<typename F>
  F slope(F const *data, size_t length, F mean) {
    if (length<2) { return 0; }
    const F xm = (F)(length - 1)/2;
    F num{0};
    F den{0};
    for (size_t i = 0; i<length; ++i) {
      F dx = (F)i - xm;
      num += dx*(data[i] - mean);
      den += dx*dx;
    }
    return num/den;
  }

} // End of namespace tsforest::transform::core::univariate
