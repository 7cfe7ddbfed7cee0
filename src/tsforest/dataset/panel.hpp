#pragma once

#include <tsforest/predef.hpp>
#include <tsforest/errors.hpp>

namespace tsforest {

  /** Panel of univariate, fixed length series.
   *
   *  The data is stored in an Armadillo matrix with one column per series (L x N), so that each series is
   *  contiguous in memory (Armadillo is column major). The panel is immutable once built: the forest only reads it.
   *
   *  Building a panel checks that:
   *   - all series share the same length
   *   - there is no missing value (NaN)
   *  Violations raise a ConfigurationError.
   */
  class SeriesPanel {

    /// Column major data: column i is the series i
    arma::Mat<F> _data{};

    explicit SeriesPanel(arma::Mat<F>&& by_columns);

  public:

    SeriesPanel() = default;

    SeriesPanel(SeriesPanel const&) = default;

    SeriesPanel& operator =(SeriesPanel const&) = default;

    SeriesPanel(SeriesPanel&&) noexcept = default;

    SeriesPanel& operator =(SeriesPanel&&) noexcept = default;

    // --- --- --- --- --- ---
    // Builders

    /// Build from a collection of series. Ragged collections are rejected.
    static SeriesPanel from_rows(std::vector<std::vector<F>> const& rows);

    /// Build from a (N series x L timepoints) matrix
    static SeriesPanel from_mat(arma::Mat<F> const& n_by_l);

    /// Build from a (1 channel x L timepoints x N series) cube; the channel dimension is squeezed.
    /// Cubes with more than one channel are rejected.
    static SeriesPanel from_cube(arma::Cube<F> const& cube);

    // --- --- --- --- --- ---
    // Access

    /// Number of series
    inline size_t size() const { return _data.n_cols; }

    /// Length of the series
    inline size_t length() const { return _data.n_rows; }

    /// Check if the panel has no series
    inline bool empty() const { return _data.n_cols==0; }

    /// Raw pointer to the series 'idx', valid for length() values
    inline F const *series(size_t idx) const { return _data.colptr(idx); }

    /// Value of the series 'idx' at timepoint 't'
    inline F at(size_t idx, size_t t) const { return _data(t, idx); }

    /// Underlying (L x N) matrix
    inline arma::Mat<F> const& data() const { return _data; }
  };

} // End of namespace tsforest
