#pragma once

#include <tsforest/predef.hpp>

#include "member.hpp"

namespace tsforest::classifier::TSF {

  /** Temporal importance curves of a fitted forest.
   *  For each timepoint t, sum over all the intervals of all the members covering t of:
   *   - mean:     the importance of the interval mean feature
   *   - stddev:   the importance of the interval standard deviation feature
   *   - slope:    the importance of the interval slope feature
   *   - coverage: 1
   *  No normalisation is applied: divide by 'coverage' for per timepoint averages.
   */
  struct TemporalCurves {
    arma::rowvec mean;
    arma::rowvec stddev;
    arma::rowvec slope;
    arma::rowvec coverage;

    inline size_t length() const { return coverage.n_elem; }

    Json::Value to_json() const;
  };

  /// Fold the per interval importances of 'members' back onto the timepoints [0, series_length[.
  /// Throw a ConfigurationError if a member reports less than 3 importances per interval.
  TemporalCurves compute_curves(std::vector<FittedMember> const& members, size_t series_length);

} // End of namespace tsforest::classifier::TSF
