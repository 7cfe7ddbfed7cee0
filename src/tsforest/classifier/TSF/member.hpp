#pragma once

#include <tsforest/predef.hpp>
#include <tsforest/dataset/panel.hpp>
#include <tsforest/transform/intervals.hpp>
#include <tsforest/classifier/learner/base_learner.hpp>

namespace tsforest::classifier::TSF {

  /// One member of the forest: a fitted learner, and the intervals its features are computed over.
  /// The intervals are required at prediction time to rebuild the same features.
  struct FittedMember {
    transform::IntervalSet intervals;
    std::shared_ptr<const learner::i_BaseLearner> estimator;
  };

  /** Fit one member of the forest.
   *  Clone 'base_learner' with 'seed', summarise 'panel' over 'intervals', and fit the clone on the
   *  resulting features against the encoded 'labels'.
   *  Only reads its arguments: concurrent calls sharing the panel and the labels are safe.
   *  Errors raised by the learner are propagated as is.
   */
  FittedMember fit_member(
    learner::i_BaseLearner const& base_learner,
    size_t seed,
    SeriesPanel const& panel,
    arma::Row<size_t> const& labels,
    size_t nb_classes,
    transform::IntervalSet intervals
  );

  /// (N x nb_classes) class probabilities of a fitted member over a panel
  arma::mat member_predict_proba(FittedMember const& member, SeriesPanel const& panel);

} // End of namespace tsforest::classifier::TSF
