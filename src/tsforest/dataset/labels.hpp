#pragma once

#include <tsforest/predef.hpp>
#include <tsforest/errors.hpp>

namespace tsforest {

  /// Bidirectional mapping between labels and their index encoding.
  /// Labels are encoded following their natural (sorted) order, so that the same set of labels
  /// always produces the same encoding.
  class LabelEncoder {

    /// Set of labels for the dataset, with index encoding
    std::map<L, EL> _label_to_index;

    /// Reverse mapping index top label
    std::vector<L> _index_to_label;

  public:

    LabelEncoder() = default;

    /// Create a new encoder given a set of labels
    explicit LabelEncoder(std::set<L> const& labels) {
      for (auto const& k : labels) {
        _label_to_index[k] = _index_to_label.size();
        _index_to_label.push_back(k);
      }
    }

    /// Create a new encoder from the distinct values of a label vector
    template<typename Collection>
    static LabelEncoder from_labels(Collection const& labels) {
      return LabelEncoder(std::set<L>(std::begin(labels), std::end(labels)));
    }

    // --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- ---

    /// Indexes to labels encoding, in label order
    inline std::vector<L> const& index_to_label() const { return _index_to_label; }

    /// Number of encoded labels
    inline size_t size() const { return _index_to_label.size(); }

    /// Encode a label. Unknown labels raise a ConfigurationError.
    inline EL encode(L const& l) const {
      auto it = _label_to_index.find(l);
      if (it==_label_to_index.end()) { throw ConfigurationError("Unknown label '" + l + "'"); }
      return it->second;
    }

    /// Encode a vector of labels
    inline arma::Row<size_t> encode(std::vector<L> const& labels) const {
      arma::Row<size_t> result(labels.size());
      for (size_t i = 0; i<labels.size(); ++i) { result[i] = encode(labels[i]); }
      return result;
    }

    /// Decode a label
    inline L const& decode(EL el) const { return _index_to_label.at(el); }
  };

} // End of namespace tsforest
