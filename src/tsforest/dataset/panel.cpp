#include "panel.hpp"

namespace tsforest {

  SeriesPanel::SeriesPanel(arma::Mat<F>&& by_columns) : _data(std::move(by_columns)) {
    if (_data.has_nan()) { throw ConfigurationError("Series panel contains missing values (NaN)"); }
  }

  SeriesPanel SeriesPanel::from_rows(std::vector<std::vector<F>> const& rows) {
    if (rows.empty()) { return SeriesPanel(arma::Mat<F>()); }
    const size_t length = rows.front().size();
    arma::Mat<F> m(length, rows.size());
    for (size_t i = 0; i<rows.size(); ++i) {
      auto const& r = rows[i];
      if (r.size()!=length) {
        throw ConfigurationError(
          "Series " + std::to_string(i) + " has length " + std::to_string(r.size())
          + ", expected " + std::to_string(length) + " (all series must have the same length)"
        );
      }
      std::copy(r.begin(), r.end(), m.colptr(i));
    }
    return SeriesPanel(std::move(m));
  }

  SeriesPanel SeriesPanel::from_mat(arma::Mat<F> const& n_by_l) {
    return SeriesPanel(arma::Mat<F>(n_by_l.t()));
  }

  SeriesPanel SeriesPanel::from_cube(arma::Cube<F> const& cube) {
    if (cube.n_rows!=1) {
      throw ConfigurationError(
        "Expected univariate series (1 channel), got " + std::to_string(cube.n_rows) + " channels"
      );
    }
    // Each slice is a 1 x L row: column i of the result is slice i
    arma::Mat<F> m(cube.n_cols, cube.n_slices);
    for (size_t i = 0; i<cube.n_slices; ++i) { m.col(i) = cube.slice(i).row(0).t(); }
    return SeriesPanel(std::move(m));
  }

} // End of namespace tsforest
