#include <catch2/catch.hpp>

#include "config.hpp"

using namespace tsforest;
using namespace tsforest::classifier::TSF;

TEST_CASE("TSF configuration defaults", "[TSF][config]") {
  TSFConfig c;
  REQUIRE(c.min_interval==3);
  REQUIRE(c.nb_estimators==200);
  REQUIRE(c.nb_threads==1);
  REQUIRE_FALSE(c.random_state.has_value());
  REQUIRE_FALSE(c.time_limit_in_minutes.has_value());
  REQUIRE_NOTHROW(c.validate());
  REQUIRE(c.planned_nb_estimators()==200);
}

TEST_CASE("TSF configuration validation", "[TSF][config]") {
  TSFConfig c;

  SECTION("Zero threads") {
    c.nb_threads = 0;
    REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
  }

  SECTION("Zero estimators") {
    c.nb_estimators = 0;
    REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
  }

  SECTION("Zero minimum interval") {
    c.min_interval = 0;
    REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
  }

  SECTION("Non positive time limit") {
    c.time_limit_in_minutes = 0.0;
    REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
    c.time_limit_in_minutes = -1.0;
    REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
  }

  SECTION("Zero contract cap") {
    c.contract_max_nb_estimators = 0;
    REQUIRE_THROWS_AS(c.validate(), ConfigurationError);
  }
}

TEST_CASE("TSF planned number of estimators", "[TSF][config]") {
  TSFConfig c;
  c.nb_estimators = 10;
  c.contract_max_nb_estimators = 4;
  // The cap only applies under a time limit
  REQUIRE(c.planned_nb_estimators()==10);
  c.time_limit_in_minutes = 1.0;
  REQUIRE(c.planned_nb_estimators()==4);
  c.contract_max_nb_estimators = 50;
  REQUIRE(c.planned_nb_estimators()==10);
}

TEST_CASE("TSF configuration JSON", "[TSF][config]") {

  SECTION("Round trip") {
    TSFConfig c;
    c.min_interval = 5;
    c.nb_estimators = 17;
    c.nb_threads = 3;
    c.random_state = 1234;
    c.time_limit_in_minutes = 0.5;
    c.contract_max_nb_estimators = 9;

    TSFConfig d = TSFConfig::from_json(c.to_json());
    REQUIRE(d.min_interval==5);
    REQUIRE(d.nb_estimators==17);
    REQUIRE(d.nb_threads==3);
    REQUIRE(d.random_state==std::optional<size_t>(1234));
    REQUIRE(d.time_limit_in_minutes==std::optional<double>(0.5));
    REQUIRE(d.contract_max_nb_estimators==std::optional<size_t>(9));
  }

  SECTION("Unset options are null, missing keys keep defaults") {
    Json::Value j = TSFConfig().to_json();
    REQUIRE(j["random_state"].isNull());
    REQUIRE(j["time_limit_in_minutes"].isNull());

    Json::Value partial;
    partial["nb_estimators"] = 12;
    partial["unknown"] = "ignored";
    TSFConfig d = TSFConfig::from_json(partial);
    REQUIRE(d.nb_estimators==12);
    REQUIRE(d.min_interval==3);
  }

  SECTION("Invalid values") {
    Json::Value j;
    j["nb_threads"] = "four";
    REQUIRE_THROWS_AS(TSFConfig::from_json(j), ConfigurationError);

    Json::Value k;
    k["nb_threads"] = -2;
    REQUIRE_THROWS_AS(TSFConfig::from_json(k), ConfigurationError);

    Json::Value l;
    l["nb_threads"] = 0;
    REQUIRE_THROWS_AS(TSFConfig::from_json(l), ConfigurationError);

    REQUIRE_THROWS_AS(TSFConfig::from_json(Json::Value(3)), ConfigurationError);
  }
}
