#include "curves.hpp"

#include <tsforest/transform/interval_features.hpp>

namespace tsforest::classifier::TSF {

  namespace {
    Json::Value row_to_json(arma::rowvec const& v) {
      Json::Value result(Json::arrayValue);
      for (double d : v) { result.append(d); }
      return result;
    }
  }

  Json::Value TemporalCurves::to_json() const {
    Json::Value j;
    j["mean"] = row_to_json(mean);
    j["stddev"] = row_to_json(stddev);
    j["slope"] = row_to_json(slope);
    j["coverage"] = row_to_json(coverage);
    return j;
  }

  TemporalCurves compute_curves(std::vector<FittedMember> const& members, size_t series_length) {
    using namespace transform;

    TemporalCurves curves{
      .mean = arma::rowvec(series_length, arma::fill::zeros),
      .stddev = arma::rowvec(series_length, arma::fill::zeros),
      .slope = arma::rowvec(series_length, arma::fill::zeros),
      .coverage = arma::rowvec(series_length, arma::fill::zeros)
    };

    for (size_t m = 0; m<members.size(); ++m) {
      FittedMember const& member = members[m];
      const arma::rowvec importances = member.estimator->feature_importances();
      if (importances.n_elem<FEATURES_PER_INTERVAL*member.intervals.size()) {
        throw ConfigurationError(
          "Member " + std::to_string(m) + " reports " + std::to_string(importances.n_elem)
          + " feature importances for " + std::to_string(member.intervals.size()) + " intervals"
        );
      }
      for (size_t j = 0; j<member.intervals.size(); ++j) {
        Interval const& itv = member.intervals[j];
        const double imean = importances[feature_column(j, MEAN)];
        const double istd = importances[feature_column(j, STDDEV)];
        const double islope = importances[feature_column(j, SLOPE)];
        if (itv.start>=itv.end || itv.end>series_length) {
          throw ConfigurationError(
            "Member " + std::to_string(m) + ": interval [" + std::to_string(itv.start) + ", "
            + std::to_string(itv.end) + "[ does not fit in series of length " + std::to_string(series_length)
          );
        }
        for (size_t t = itv.start; t<itv.end; ++t) {
          curves.coverage[t] += 1;
          curves.mean[t] += imean;
          curves.stddev[t] += istd;
          curves.slope[t] += islope;
        }
      }
    }

    return curves;
  }

} // End of namespace tsforest::classifier::TSF
