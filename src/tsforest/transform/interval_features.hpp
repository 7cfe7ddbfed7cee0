#pragma once

#include <tsforest/predef.hpp>
#include <tsforest/dataset/panel.hpp>

#include "intervals.hpp"

namespace tsforest::transform {

  /// Number of features per interval: mean, standard deviation, slope
  constexpr size_t FEATURES_PER_INTERVAL = 3;

  /// Offsets of the features inside the group of an interval
  enum IntervalFeature : size_t {
    MEAN = 0,
    STDDEV = 1,
    SLOPE = 2
  };

  /// Column of the feature 'f' of the interval 'j' in a feature matrix
  inline size_t feature_column(size_t j, IntervalFeature f) { return FEATURES_PER_INTERVAL*j + f; }

  /** Summarise each series of a panel over a set of intervals.
   *  Produces a (N series x 3K) matrix: for the interval j, the columns 3j, 3j+1 and 3j+2 respectively hold
   *  the mean, the population standard deviation and the least squares slope of the series over [start_j, end_j[.
   *  Rows follow the order of the series in the panel.
   *  Throw a ConfigurationError if an interval is empty or does not fit in the series.
   */
  arma::Mat<F> extract_features(SeriesPanel const& panel, IntervalSet const& intervals);

} // End of namespace tsforest::transform
