#include <catch2/catch.hpp>

#include "panel.hpp"
#include "labels.hpp"

using namespace tsforest;

TEST_CASE("Series panel construction", "[dataset][panel]") {

  SECTION("From rows") {
    auto p = SeriesPanel::from_rows({{1, 2, 3}, {4, 5, 6}});
    REQUIRE(p.size()==2);
    REQUIRE(p.length()==3);
    REQUIRE(p.at(1, 0)==4);
    REQUIRE(p.series(0)[2]==3);
  }

  SECTION("Ragged rows are rejected") {
    REQUIRE_THROWS_AS(SeriesPanel::from_rows({{1, 2, 3}, {4, 5}}), ConfigurationError);
  }

  SECTION("Missing values are rejected") {
    REQUIRE_THROWS_AS(SeriesPanel::from_rows({{1, std::nan(""), 3}}), ConfigurationError);
  }

  SECTION("Empty") {
    auto p = SeriesPanel::from_rows({});
    REQUIRE(p.empty());
    REQUIRE(p.size()==0);
  }

  SECTION("From a (N x L) matrix") {
    arma::mat m = {{1, 2, 3, 4}, {5, 6, 7, 8}};
    auto p = SeriesPanel::from_mat(m);
    REQUIRE(p.size()==2);
    REQUIRE(p.length()==4);
    REQUIRE(p.at(1, 3)==8);
  }

  SECTION("From a (1 x L x N) cube, squeezing the channel") {
    arma::cube c(1, 5, 3);
    for (size_t s = 0; s<3; ++s) { for (size_t t = 0; t<5; ++t) { c(0, t, s) = (double)(10*s + t); }}
    auto p = SeriesPanel::from_cube(c);
    REQUIRE(p.size()==3);
    REQUIRE(p.length()==5);
    REQUIRE(p.at(2, 4)==24);
  }

  SECTION("Multi channel cubes are rejected") {
    arma::cube c(2, 5, 3, arma::fill::zeros);
    REQUIRE_THROWS_AS(SeriesPanel::from_cube(c), ConfigurationError);
  }
}

TEST_CASE("Label encoder", "[dataset][labels]") {
  std::vector<L> labels{"b", "a", "c", "a", "b"};
  auto enc = LabelEncoder::from_labels(labels);

  REQUIRE(enc.size()==3);
  REQUIRE(enc.index_to_label()==std::vector<L>{"a", "b", "c"});
  REQUIRE(enc.encode("c")==2);
  REQUIRE(enc.decode(1)=="b");
  REQUIRE_THROWS_AS(enc.encode("z"), ConfigurationError);

  arma::Row<size_t> encoded = enc.encode(labels);
  REQUIRE(encoded.n_elem==5);
  REQUIRE(encoded[0]==1);
  REQUIRE(encoded[1]==0);
  REQUIRE(encoded[2]==2);
}
