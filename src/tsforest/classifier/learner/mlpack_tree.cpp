#include "mlpack_tree.hpp"

#include <tsforest/errors.hpp>

#include <mlpack/methods/decision_tree/decision_tree.hpp>

namespace tsforest::classifier::learner {

  namespace {

    using Tree = mlpack::DecisionTree<mlpack::InformationGain>;

    /// Entropy (base 2) of a class distribution given by counts summing to 'total'
    double entropy(std::vector<size_t> const& counts, size_t total) {
      if (total==0) { return 0; }
      double h = 0;
      for (size_t c : counts) {
        if (c>0) {
          double p = (double)c/(double)total;
          h -= p*std::log2(p);
        }
      }
      return h;
    }

    /// Route the exemplars 'idx' (columns of 'data') through 'node' and accumulate, per split dimension,
    /// the entropy decrease weighted by the number of exemplars reaching the node.
    void accumulate_importances(
      Tree const& node,
      arma::mat const& data,
      arma::Row<size_t> const& labels,
      size_t nb_classes,
      std::vector<size_t> const& idx,
      arma::rowvec& importances
    ) {
      const size_t nbchildren = node.NumChildren();
      if (nbchildren==0 || idx.empty()) { return; }

      std::vector<std::vector<size_t>> branches(nbchildren);
      for (size_t i : idx) { branches[node.CalculateDirection(data.col(i))].push_back(i); }

      auto counts_of = [&](std::vector<size_t> const& subset) {
        std::vector<size_t> counts(nb_classes, 0);
        for (size_t i : subset) { counts[labels[i]]++; }
        return counts;
      };

      double decrease = (double)idx.size()*entropy(counts_of(idx), idx.size());
      for (auto const& b : branches) { decrease -= (double)b.size()*entropy(counts_of(b), b.size()); }
      importances[node.SplitDimension()] += decrease;

      for (size_t c = 0; c<nbchildren; ++c) {
        accumulate_importances(node.Child(c), data, labels, nb_classes, branches[c], importances);
      }
    }

    size_t count_nodes(Tree const& node) {
      size_t n = 1;
      for (size_t c = 0; c<node.NumChildren(); ++c) { n += count_nodes(node.Child(c)); }
      return n;
    }

    size_t tree_depth(Tree const& node) {
      size_t d = 0;
      for (size_t c = 0; c<node.NumChildren(); ++c) { d = std::max(d, tree_depth(node.Child(c))); }
      return d + 1;
    }

  } // End of anonymous namespace

  struct MLPackDecisionTree::Impl {
    Tree tree;
    size_t nb_classes{0};
    arma::rowvec importances;
  };

  MLPackDecisionTree::MLPackDecisionTree(Params params, size_t seed) : _params(params), _seed(seed) {}

  MLPackDecisionTree::~MLPackDecisionTree() = default;

  std::unique_ptr<i_BaseLearner> MLPackDecisionTree::clone_with_seed(size_t seed) const {
    return std::make_unique<MLPackDecisionTree>(_params, seed);
  }

  void MLPackDecisionTree::fit(arma::Mat<F> const& features, arma::Row<size_t> const& labels, size_t nb_classes) {
    if (features.n_rows!=labels.n_elem) {
      throw std::invalid_argument(
        "Decision tree: " + std::to_string(features.n_rows) + " exemplars but "
        + std::to_string(labels.n_elem) + " labels"
      );
    }
    if (features.n_rows==0) { throw std::invalid_argument("Decision tree: no exemplar to fit"); }
    if (nb_classes==0 || labels.max()>=nb_classes) {
      throw std::invalid_argument("Decision tree: labels must be encoded in [0, nb_classes[");
    }

    // mlpack works with one exemplar per column
    const arma::mat data = features.t();

    auto impl = std::make_unique<Impl>();
    impl->nb_classes = nb_classes;
    impl->tree.Train(
      data, labels, nb_classes,
      _params.minimum_leaf_size, _params.minimum_gain_split, _params.maximum_depth
    );

    // Mean decrease in impurity
    impl->importances = arma::rowvec(data.n_rows, arma::fill::zeros);
    std::vector<size_t> all(data.n_cols);
    std::iota(all.begin(), all.end(), 0);
    accumulate_importances(impl->tree, data, labels, nb_classes, all, impl->importances);
    const double total = arma::accu(impl->importances);
    if (total>0) { impl->importances /= total; }

    pImpl = std::move(impl);
  }

  arma::mat MLPackDecisionTree::predict_proba(arma::Mat<F> const& features) const {
    if (!pImpl) { throw NotFittedError("Decision tree: predict_proba called before fit"); }
    if (features.n_cols!=pImpl->importances.n_elem) {
      throw std::invalid_argument(
        "Decision tree: fitted on " + std::to_string(pImpl->importances.n_elem) + " features, got "
        + std::to_string(features.n_cols)
      );
    }
    const arma::mat data = features.t();
    arma::Row<size_t> predictions;
    arma::mat probabilities;
    pImpl->tree.Classify(data, predictions, probabilities);
    // mlpack: (nb_classes x N), one exemplar per column
    return probabilities.t();
  }

  arma::rowvec MLPackDecisionTree::feature_importances() const {
    if (!pImpl) { throw NotFittedError("Decision tree: feature_importances called before fit"); }
    return pImpl->importances;
  }

  Json::Value MLPackDecisionTree::to_json() const {
    Json::Value j;
    j["name"] = name();
    j["minimum_leaf_size"] = Json::UInt64(_params.minimum_leaf_size);
    j["minimum_gain_split"] = _params.minimum_gain_split;
    j["maximum_depth"] = Json::UInt64(_params.maximum_depth);
    j["seed"] = Json::UInt64(_seed);
    return j;
  }

  size_t MLPackDecisionTree::nb_nodes() const {
    if (!pImpl) { throw NotFittedError("Decision tree: nb_nodes called before fit"); }
    return count_nodes(pImpl->tree);
  }

  size_t MLPackDecisionTree::depth() const {
    if (!pImpl) { throw NotFittedError("Decision tree: depth called before fit"); }
    return tree_depth(pImpl->tree);
  }

} // End of namespace tsforest::classifier::learner
