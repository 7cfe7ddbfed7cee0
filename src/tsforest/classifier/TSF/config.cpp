#include "config.hpp"

namespace tsforest::classifier::TSF {

  namespace {

    std::optional<size_t> read_uint(Json::Value const& j, char const *key) {
      if (!j.isMember(key) || j[key].isNull()) { return {}; }
      Json::Value const& v = j[key];
      if (!v.isUInt64()) { throw ConfigurationError(std::string("'") + key + "' must be a non negative integer"); }
      return {(size_t)v.asUInt64()};
    }

    std::optional<double> read_double(Json::Value const& j, char const *key) {
      if (!j.isMember(key) || j[key].isNull()) { return {}; }
      Json::Value const& v = j[key];
      if (!v.isNumeric()) { throw ConfigurationError(std::string("'") + key + "' must be a number"); }
      return {v.asDouble()};
    }

  }

  void TSFConfig::validate() const {
    if (min_interval==0) { throw ConfigurationError("min_interval must be at least 1"); }
    if (nb_estimators==0) { throw ConfigurationError("nb_estimators must be at least 1"); }
    if (nb_threads==0) { throw ConfigurationError("nb_threads must be at least 1"); }
    if (time_limit_in_minutes && !(time_limit_in_minutes.value()>0)) {
      throw ConfigurationError("time_limit_in_minutes must be strictly positive");
    }
    if (contract_max_nb_estimators && contract_max_nb_estimators.value()==0) {
      throw ConfigurationError("contract_max_nb_estimators must be at least 1");
    }
  }

  size_t TSFConfig::planned_nb_estimators() const {
    if (time_limit_in_minutes && contract_max_nb_estimators) {
      return std::min(nb_estimators, contract_max_nb_estimators.value());
    }
    return nb_estimators;
  }

  Json::Value TSFConfig::to_json() const {
    Json::Value j;
    j["min_interval"] = Json::UInt64(min_interval);
    j["nb_estimators"] = Json::UInt64(nb_estimators);
    j["nb_threads"] = Json::UInt64(nb_threads);
    j["random_state"] = random_state ? Json::Value(Json::UInt64(random_state.value())) : Json::Value();
    j["time_limit_in_minutes"] = time_limit_in_minutes ? Json::Value(time_limit_in_minutes.value()) : Json::Value();
    j["contract_max_nb_estimators"] =
      contract_max_nb_estimators ? Json::Value(Json::UInt64(contract_max_nb_estimators.value())) : Json::Value();
    return j;
  }

  TSFConfig TSFConfig::from_json(Json::Value const& j) {
    if (!j.isObject()) { throw ConfigurationError("TSF configuration must be a JSON object"); }
    TSFConfig c;
    if (auto v = read_uint(j, "min_interval")) { c.min_interval = v.value(); }
    if (auto v = read_uint(j, "nb_estimators")) { c.nb_estimators = v.value(); }
    if (auto v = read_uint(j, "nb_threads")) { c.nb_threads = v.value(); }
    c.random_state = read_uint(j, "random_state");
    c.time_limit_in_minutes = read_double(j, "time_limit_in_minutes");
    c.contract_max_nb_estimators = read_uint(j, "contract_max_nb_estimators");
    c.validate();
    return c;
  }

} // End of namespace tsforest::classifier::TSF
