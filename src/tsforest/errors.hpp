#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tsforest {

  /// Invalid input or parameter, detected before any sampling or fitting starts.
  /// Nothing is fitted when this is thrown.
  struct ConfigurationError : public std::invalid_argument {
    explicit ConfigurationError(std::string const& msg) : std::invalid_argument(msg) {}
  };

  /// Inference or inspection requested on a model that has not been (successfully) fitted
  struct NotFittedError : public std::logic_error {
    explicit NotFittedError(std::string const& msg) : std::logic_error(msg) {}
  };

  /// The base learner of one ensemble member failed to fit. Aborts the whole forest fit.
  class WorkerFitError : public std::runtime_error {
    size_t _member_index;

  public:
    WorkerFitError(size_t member_index, std::string const& what) :
      std::runtime_error("Member " + std::to_string(member_index) + ": " + what),
      _member_index(member_index) {}

    /// Index of the failing member in the ensemble
    inline size_t member_index() const { return _member_index; }
  };

} // End of namespace tsforest
