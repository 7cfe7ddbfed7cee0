#pragma once

#include <tsforest/predef.hpp>

namespace tsforest::classifier::learner {

  /** Tree learner used as the base estimator of an ensemble.
   *  The forest never looks inside a learner: it clones a template, fits the clone on a feature matrix,
   *  asks for class probabilities and for the importance of each feature column.
   *
   *  Feature matrices are (N exemplars x D features). Labels are encoded in [0, nb_classes[.
   *  A fitted learner is only read afterwards: const methods must be safe to call concurrently.
   */
  struct i_BaseLearner {

    virtual ~i_BaseLearner() = default;

    /// Fresh, unfitted copy of this learner with the same hyper parameters and the given seed
    virtual std::unique_ptr<i_BaseLearner> clone_with_seed(size_t seed) const = 0;

    /// Fit on (features, labels). Throw on failure.
    virtual void fit(arma::Mat<F> const& features, arma::Row<size_t> const& labels, size_t nb_classes) = 0;

    /// (N x nb_classes) matrix of class probabilities, one row per exemplar (row of 'features')
    virtual arma::mat predict_proba(arma::Mat<F> const& features) const = 0;

    /// Importance of each feature column (length D), as computed from the splits of the fitted learner
    virtual arma::rowvec feature_importances() const = 0;

    /// Learner name, used in JSON summaries
    virtual std::string name() const = 0;

    /// Hyper parameters as JSON
    virtual Json::Value to_json() const = 0;
  };

} // End of namespace tsforest::classifier::learner
