#include "intervals.hpp"

namespace tsforest::transform {

  namespace {

    /// Uniform draw in [0, high[; 0 if the range is empty
    size_t randint(size_t high, PRNG& prng) {
      if (high==0) { return 0; }
      return std::uniform_int_distribution<size_t>(0, high - 1)(prng);
    }

  }

  size_t default_nb_intervals(size_t series_length) {
    auto k = (size_t)std::sqrt((double)series_length);
    return std::max<size_t>(k, 1);
  }

  size_t effective_min_interval(size_t min_interval, size_t series_length) {
    return std::min(min_interval, series_length);
  }

  IntervalSet sample_intervals(size_t series_length, size_t nb_intervals, size_t min_interval, PRNG& prng) {
    if (series_length<2) {
      throw ConfigurationError("Cannot sample intervals over series of length " + std::to_string(series_length));
    }
    if (nb_intervals==0) { throw ConfigurationError("Number of intervals must be at least 1"); }
    if (min_interval==0 || min_interval>series_length) {
      throw ConfigurationError(
        "Minimum interval length must be in [1, " + std::to_string(series_length) + "], got "
        + std::to_string(min_interval)
      );
    }

    IntervalSet result;
    result.reserve(nb_intervals);
    for (size_t j = 0; j<nb_intervals; ++j) {
      const size_t start = randint(series_length - min_interval, prng);
      size_t length = randint(series_length - start - 1, prng);
      if (length<min_interval) { length = min_interval; }
      result.push_back(Interval{start, start + length});
    }
    return result;
  }

  Json::Value to_json(IntervalSet const& intervals) {
    Json::Value result(Json::arrayValue);
    for (auto const& itv : intervals) {
      Json::Value pair(Json::arrayValue);
      pair.append(Json::UInt64(itv.start));
      pair.append(Json::UInt64(itv.end));
      result.append(pair);
    }
    return result;
  }

} // End of namespace tsforest::transform
