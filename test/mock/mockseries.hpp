#pragma once

#include <random>
#include <optional>

#include <tsforest/predef.hpp>
#include <tsforest/dataset/panel.hpp>

namespace mock {
  using namespace std;

  /// Mocker class - generate panels with a seeded PRNG
  template<typename PRNG = mt19937_64>
  struct Mocker {

    // --- --- --- Fields, open for configuration

    // Random number generator - should be init in the constructor
    unsigned int _seed;
    PRNG _prng;
    // Length of the series
    size_t _fixl{25};
    // Possible values of the series
    double _minv{0};
    double _maxv{2};

    // --- --- --- Constructor

    /** Build a mocker with a random seed. If none is given, one is generated */
    explicit Mocker(std::optional<unsigned int> seed = {}) {
      if (seed.has_value()) {
        _seed = seed.value();
      } else {
        std::random_device r;
        _seed = r();
      }
      _prng = PRNG(_seed);
    }

    // --- --- --- Methods

    /** Generate a vector of a given size with random real values in the half-closed interval [minv, maxv[. */
    [[nodiscard]] std::vector<double> randvec(size_t size, double minv, double maxv) {
      std::uniform_real_distribution<double> udist{minv, maxv};
      std::vector<double> v(size);
      std::generate(v.begin(), v.end(), [this, &udist]() { return udist(_prng); });
      return v;
    }

    /** Generate a dataset of fixed length series with nbitems, with values in [_minv, _maxv[ */
    [[nodiscard]] vector<vector<double>> vec_randvec(size_t nbitems) {
      vector<vector<double>> set;
      for (size_t i = 0; i<nbitems; ++i) { set.push_back(randvec(_fixl, _minv, _maxv)); }
      return set;
    }

    /** Random panel of nbitems series of length _fixl */
    [[nodiscard]] tsforest::SeriesPanel panel(size_t nbitems) {
      return tsforest::SeriesPanel::from_rows(vec_randvec(nbitems));
    }

    /** Two classes panel: "up" series trend upward, "down" series trend downward, with noise in [_minv, _maxv[.
     *  Classes alternate: even indexes are "up", odd indexes are "down". */
    [[nodiscard]] std::tuple<tsforest::SeriesPanel, std::vector<std::string>> trend_panel(size_t nbitems) {
      vector<vector<double>> set;
      vector<std::string> labels;
      for (size_t i = 0; i<nbitems; ++i) {
        auto s = randvec(_fixl, _minv, _maxv);
        const bool up = i%2==0;
        for (size_t t = 0; t<_fixl; ++t) { s[t] += (up ? 1.0 : -1.0)*(double)t; }
        set.push_back(std::move(s));
        labels.emplace_back(up ? "up" : "down");
      }
      return {tsforest::SeriesPanel::from_rows(set), std::move(labels)};
    }

  };

} // End of namespace mock
