#include "interval_features.hpp"

#include "core/univariate.interval.hpp"

namespace tsforest::transform {

  arma::Mat<F> extract_features(SeriesPanel const& panel, IntervalSet const& intervals) {
    namespace cu = core::univariate;
    const size_t nbseries = panel.size();
    const size_t length = panel.length();

    arma::Mat<F> result(nbseries, FEATURES_PER_INTERVAL*intervals.size());

    for (size_t j = 0; j<intervals.size(); ++j) {
      Interval const& itv = intervals[j];
      if (itv.start>=itv.end || itv.end>length) {
        throw ConfigurationError(
          "Interval [" + std::to_string(itv.start) + ", " + std::to_string(itv.end)
          + "[ does not fit in series of length " + std::to_string(length)
        );
      }
      const size_t n = itv.length();
      for (size_t i = 0; i<nbseries; ++i) {
        F const *s = panel.series(i) + itv.start;
        const F m = cu::mean(s, n);
        result(i, feature_column(j, MEAN)) = m;
        result(i, feature_column(j, STDDEV)) = cu::stddev(s, n, m);
        result(i, feature_column(j, SLOPE)) = cu::slope(s, n, m);
      }
    }

    return result;
  }

} // End of namespace tsforest::transform
