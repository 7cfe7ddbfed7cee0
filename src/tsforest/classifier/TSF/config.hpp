#pragma once

#include <tsforest/predef.hpp>
#include <tsforest/errors.hpp>

namespace tsforest::classifier::TSF {

  /// Time Series Forest parameters
  struct TSFConfig {

    /// Minimum length of an interval; clamped to the series length at fit time
    size_t min_interval{3};

    /// Number of trees in the forest. Under a time limit, upper bound on the number of trees.
    size_t nb_estimators{200};

    /// Number of threads used to fit and predict; 1 for sequential
    size_t nb_threads{1};

    /// Seed of the forest. If none is given, one is drawn from a random device at fit time.
    std::optional<size_t> random_state{};

    /// Stop fitting new trees once this budget (in minutes) is exhausted
    std::optional<double> time_limit_in_minutes{};

    /// Under a time limit, maximum number of trees
    std::optional<size_t> contract_max_nb_estimators{};

    /// Check the parameters; throw a ConfigurationError on invalid values
    void validate() const;

    /// Number of trees planned for a fit: nb_estimators, capped by contract_max_nb_estimators under a time limit
    size_t planned_nb_estimators() const;

    /// Record the parameters as JSON; unset options are recorded as null
    Json::Value to_json() const;

    /// Build parameters from JSON. Missing or null keys keep their default value; unknown keys are ignored.
    /// Wrongly typed values raise a ConfigurationError. The result is validated.
    static TSFConfig from_json(Json::Value const& j);
  };

} // End of namespace tsforest::classifier::TSF
