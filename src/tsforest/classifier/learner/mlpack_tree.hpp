#pragma once

#include <tsforest/predef.hpp>
#include "base_learner.hpp"

namespace tsforest::classifier::learner {

  /** Decision tree base learner backed by mlpack's DecisionTree, splitting on the information gain (entropy).
   *
   *  Feature importances are the mean decrease in impurity: the training exemplars are routed through the
   *  fitted tree, and each internal node credits its split dimension with the (exemplar weighted) entropy
   *  decrease it achieves. Importances are normalised to sum to 1, or are all 0 if the tree is a single leaf.
   *
   *  mlpack's tree evaluates every dimension at every node: training does not depend on the seed,
   *  which is only recorded. Trees fitted on the same features are identical: in a forest, the diversity of the
   *  members comes only from their intervals.
   */
  class MLPackDecisionTree : public i_BaseLearner {
  public:

    struct Params {
      /// Minimum number of exemplars in a leaf
      size_t minimum_leaf_size{1};
      /// Minimum gain required to split a node
      double minimum_gain_split{1e-7};
      /// Maximum depth; 0 for unlimited
      size_t maximum_depth{0};
    };

    explicit MLPackDecisionTree(Params params = {}, size_t seed = 0);

    // Note: must be non-default for pImpl with std::unique_ptr.
    ~MLPackDecisionTree() override;

    std::unique_ptr<i_BaseLearner> clone_with_seed(size_t seed) const override;

    void fit(arma::Mat<F> const& features, arma::Row<size_t> const& labels, size_t nb_classes) override;

    arma::mat predict_proba(arma::Mat<F> const& features) const override;

    arma::rowvec feature_importances() const override;

    std::string name() const override { return "mlpack_decision_tree"; }

    Json::Value to_json() const override;

    inline Params const& params() const { return _params; }

    inline size_t seed() const { return _seed; }

    /// Number of nodes of the fitted tree
    size_t nb_nodes() const;

    /// Depth of the fitted tree (a single leaf has depth 1)
    size_t depth() const;

  private:
    Params _params;
    size_t _seed;

    // PIMPL: keep mlpack's tree out of the header
    struct Impl;
    std::unique_ptr<Impl> pImpl;
  };

} // End of namespace tsforest::classifier::learner
