#include "member.hpp"

#include <tsforest/transform/interval_features.hpp>

namespace tsforest::classifier::TSF {

  FittedMember fit_member(
    learner::i_BaseLearner const& base_learner,
    size_t seed,
    SeriesPanel const& panel,
    arma::Row<size_t> const& labels,
    size_t nb_classes,
    transform::IntervalSet intervals
  ) {
    std::unique_ptr<learner::i_BaseLearner> estimator = base_learner.clone_with_seed(seed);
    const arma::Mat<F> features = transform::extract_features(panel, intervals);
    estimator->fit(features, labels, nb_classes);
    return FittedMember{std::move(intervals), std::move(estimator)};
  }

  arma::mat member_predict_proba(FittedMember const& member, SeriesPanel const& panel) {
    const arma::Mat<F> features = transform::extract_features(panel, member.intervals);
    return member.estimator->predict_proba(features);
  }

} // End of namespace tsforest::classifier::TSF
