#pragma once

#include <tsforest/predef.hpp>
#include <tsforest/errors.hpp>
#include <tsforest/utils/utils.hpp>
#include <tsforest/dataset/panel.hpp>
#include <tsforest/transform/intervals.hpp>
#include <tsforest/classifier/learner/base_learner.hpp>

#include "config.hpp"
#include "curves.hpp"
#include "member.hpp"

namespace tsforest::classifier::TSF {

  /// Read only snapshot of a fitted forest
  struct FittedParams {
    /// Distinct labels, in encoding order
    std::vector<L> classes;
    /// Intervals of each member, in member order
    std::vector<transform::IntervalSet> intervals;
    /// Fitted learner of each member, in member order
    std::vector<std::shared_ptr<const learner::i_BaseLearner>> estimators;
  };

  /** Time Series Forest classifier.
   *
   *  An ensemble of trees, each fitted on the mean, standard deviation and slope of the series computed over
   *  its own randomly sampled intervals (floor(sqrt(L)) intervals per tree, of length at least 'min_interval').
   *  Predictions average the class probabilities of the trees.
   *
   *  Fitting is reproducible for a given seed: all the intervals and the learner seeds are drawn from a single
   *  generator before any tree is fitted, so the result does not depend on the number of threads.
   *
   *  Under a time limit, trees are dispatched in order until the budget is exhausted (or the contract cap is
   *  reached); trees already dispatched are completed. The forest then holds the first trees only, at least one.
   *
   *  A failed fit leaves the forest in the state it was before the call.
   */
  class TimeSeriesForest {
  public:

    /// Build an unfitted forest. Without a base learner, use an mlpack decision tree with default parameters.
    explicit TimeSeriesForest(
      TSFConfig config = {},
      std::shared_ptr<const learner::i_BaseLearner> base_learner = nullptr
    );

    // Note: must be non-default for pImpl with std::unique_ptr.
    ~TimeSeriesForest();

    TimeSeriesForest(TimeSeriesForest&& other) noexcept;

    TimeSeriesForest& operator =(TimeSeriesForest&& other) noexcept;

    /// Progress output; nullptr (default) for none
    void set_log(std::ostream *out);

    TSFConfig const& config() const;

    learner::i_BaseLearner const& base_learner() const;

    // --- --- --- --- --- ---
    // Fit

    /// Fit the forest on a panel and its labels (parallel to the series of the panel).
    /// Throw a ConfigurationError on invalid parameters or data, a WorkerFitError if a tree fails to fit.
    void fit(SeriesPanel const& panel, std::vector<L> const& labels);

    bool is_fitted() const;

    // --- --- --- --- --- ---
    // Prediction - require a fitted forest

    /// (N x nb_classes) class probabilities averaged over the trees; columns follow 'classes()'
    arma::mat predict_proba(SeriesPanel const& panel) const;

    /// Most probable label per series. Ties go to the first class.
    std::vector<L> predict(SeriesPanel const& panel) const;

    /// Fraction of correctly predicted labels
    double score(SeriesPanel const& panel, std::vector<L> const& labels) const;

    // --- --- --- --- --- ---
    // Fitted attributes - require a fitted forest

    FittedParams get_fitted_params() const;

    std::vector<L> const& classes() const;

    size_t nb_classes() const;

    size_t series_length() const;

    /// Number of intervals per member
    size_t nb_intervals() const;

    /// Minimum interval length after clamping to the series length
    size_t min_interval() const;

    /// Number of fitted members; may be lower than the configured number under a time limit
    size_t nb_members() const;

    std::vector<FittedMember> const& members() const;

    /// Seed actually used by the last fit
    size_t seed() const;

    utils::duration_t fit_time() const;

    /// Temporal importance curves, recomputed at each call
    TemporalCurves temporal_curves() const;

    /// Summary of the forest: parameters, and fitted attributes if fitted
    Json::Value to_json() const;

  private:
    // PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
  };

} // End of namespace tsforest::classifier::TSF
