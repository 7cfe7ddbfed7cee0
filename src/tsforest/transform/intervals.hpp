#pragma once

#include <tsforest/predef.hpp>
#include <tsforest/errors.hpp>

namespace tsforest::transform {

  /// Half open interval [start, end[ over the timepoints of a series
  struct Interval {
    size_t start;
    size_t end;

    inline size_t length() const { return end - start; }

    inline bool operator ==(Interval const& other) const = default;
  };

  /// Ordered collection of intervals, one per group of 3 features (mean, stddev, slope)
  using IntervalSet = std::vector<Interval>;

  /// Default number of intervals for a series length: floor(sqrt(length)), at least 1
  size_t default_nb_intervals(size_t series_length);

  /// Minimum interval length actually used: 'min_interval', clamped to the series length
  size_t effective_min_interval(size_t min_interval, size_t series_length);

  /** Randomly generate 'nb_intervals' intervals over a series of length 'series_length'.
   *
   *  For each interval, independently:
   *    start  ~ U[0, series_length - min_interval[
   *    length ~ U[0, series_length - start - 1[, raised to min_interval if smaller
   *    end    = start + length
   *  An empty draw range yields 0.
   *  Hence the interval is at least min_interval long, and ends at or before series_length.
   *
   *  Requires series_length >= 2, nb_intervals >= 1, 1 <= min_interval <= series_length;
   *  else throw a ConfigurationError.
   */
  IntervalSet sample_intervals(size_t series_length, size_t nb_intervals, size_t min_interval, PRNG& prng);

  /// Intervals as a JSON array of [start, end] pairs
  Json::Value to_json(IntervalSet const& intervals);

} // End of namespace tsforest::transform
