#include <catch2/catch.hpp>

#include "curves.hpp"

#include <mock/stub_learner.hpp>

using namespace tsforest;
using namespace tsforest::classifier::TSF;
using transform::IntervalSet;

namespace {

  /// Member over 'intervals' whose learner reports the 'importances' given
  FittedMember mk_member(IntervalSet intervals, arma::rowvec importances) {
    auto stub = std::make_shared<mock::StubLearner>(std::make_shared<mock::StubControl>(), 0, importances);
    stub->fit(arma::mat(2, importances.n_elem, arma::fill::zeros), arma::Row<size_t>{0, 1}, 2);
    return FittedMember{std::move(intervals), std::move(stub)};
  }

}

TEST_CASE("Temporal curves", "[TSF][curves]") {

  std::vector<FittedMember> members;
  members.push_back(mk_member({{0, 3}, {2, 5}}, {0.1, 0.2, 0.3, 1, 2, 3}));
  members.push_back(mk_member({{4, 6}}, {10, 20, 30}));

  TemporalCurves c = compute_curves(members, 6);

  REQUIRE(c.length()==6);

  // Timepoint:                                0    1    2    3    4    5
  const arma::rowvec coverage = {1, 1, 2, 1, 2, 1};
  const arma::rowvec mean = {0.1, 0.1, 1.1, 1, 11, 10};
  const arma::rowvec stddev = {0.2, 0.2, 2.2, 2, 22, 20};
  const arma::rowvec slope = {0.3, 0.3, 3.3, 3, 33, 30};

  REQUIRE(arma::approx_equal(c.coverage, coverage, "absdiff", 1e-12));
  REQUIRE(arma::approx_equal(c.mean, mean, "absdiff", 1e-12));
  REQUIRE(arma::approx_equal(c.stddev, stddev, "absdiff", 1e-12));
  REQUIRE(arma::approx_equal(c.slope, slope, "absdiff", 1e-12));

  SECTION("Recomputing gives the same curves") {
    TemporalCurves d = compute_curves(members, 6);
    REQUIRE(arma::approx_equal(c.coverage, d.coverage, "absdiff", 0));
    REQUIRE(arma::approx_equal(c.mean, d.mean, "absdiff", 0));
    REQUIRE(arma::approx_equal(c.stddev, d.stddev, "absdiff", 0));
    REQUIRE(arma::approx_equal(c.slope, d.slope, "absdiff", 0));
  }

  SECTION("JSON") {
    Json::Value j = c.to_json();
    REQUIRE(j["coverage"].size()==6);
    REQUIRE(j["mean"][4].asDouble()==Approx(11));
  }

  SECTION("Not enough importances") {
    members.push_back(mk_member({{0, 2}, {1, 3}}, {1, 2, 3}));
    REQUIRE_THROWS_AS(compute_curves(members, 6), ConfigurationError);
  }

  SECTION("Interval past the end of the series") {
    members.push_back(mk_member({{3, 8}}, {1, 2, 3}));
    REQUIRE_THROWS_AS(compute_curves(members, 6), ConfigurationError);
  }

  SECTION("Empty interval") {
    members.push_back(mk_member({{3, 3}}, {1, 2, 3}));
    REQUIRE_THROWS_AS(compute_curves(members, 6), ConfigurationError);
  }
}

TEST_CASE("Temporal curves of no member", "[TSF][curves]") {
  TemporalCurves c = compute_curves({}, 4);
  REQUIRE(c.length()==4);
  REQUIRE(arma::accu(c.coverage)==0);
}
