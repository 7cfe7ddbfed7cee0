#include "tsf.hpp"

#include <tsforest/dataset/labels.hpp>
#include <tsforest/classifier/learner/mlpack_tree.hpp>

namespace tsforest::classifier::TSF {

  // --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- ---
  // TSF IMPLEMENTATION
  // --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- ---
  struct TimeSeriesForest::Impl {

    /// Everything produced by a successful fit. Built aside, then moved in at once.
    struct Fitted {
      LabelEncoder encoder;
      size_t series_length{0};
      size_t nb_intervals{0};
      size_t min_interval{0};
      size_t seed{0};
      std::vector<FittedMember> members;
      utils::duration_t fit_time{};
    };

    TSFConfig config;
    std::shared_ptr<const learner::i_BaseLearner> base_learner;
    std::ostream *log{nullptr};
    std::optional<Fitted> fitted;

    Impl(TSFConfig config, std::shared_ptr<const learner::i_BaseLearner> base_learner) :
      config(std::move(config)), base_learner(std::move(base_learner)) {
      if (!this->base_learner) { this->base_learner = std::make_shared<learner::MLPackDecisionTree>(); }
    }

    Fitted const& get_fitted(char const *what) const {
      if (!fitted) { throw NotFittedError(std::string("TimeSeriesForest: ") + what + " called before fit"); }
      return fitted.value();
    }

    // --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- ---
    // Fit
    // --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- ---

    void fit(SeriesPanel const& panel, std::vector<L> const& labels) {
      using namespace transform;

      // --- --- --- Checking
      config.validate();
      if (panel.empty()) { throw ConfigurationError("Cannot fit on an empty panel"); }
      if (labels.size()!=panel.size()) {
        throw ConfigurationError(
          "Got " + std::to_string(labels.size()) + " labels for " + std::to_string(panel.size()) + " series"
        );
      }
      if (panel.length()<2) {
        throw ConfigurationError("Series must have at least 2 timepoints, got " + std::to_string(panel.length()));
      }

      const auto start_time = utils::now();

      // --- --- --- Forest wide parameters
      Fitted f;
      f.series_length = panel.length();
      f.nb_intervals = default_nb_intervals(f.series_length);
      f.min_interval = effective_min_interval(config.min_interval, f.series_length);
      f.encoder = LabelEncoder::from_labels(labels);
      const arma::Row<size_t> encoded = f.encoder.encode(labels);
      const size_t nb_classes = f.encoder.size();
      f.seed = config.random_state ? config.random_state.value() : (size_t)std::random_device{}();

      // --- --- --- Randomness for all the members, drawn up front from a single stream
      const size_t planned = config.planned_nb_estimators();
      PRNG prng(f.seed);
      std::vector<IntervalSet> intervals;
      intervals.reserve(planned);
      for (size_t i = 0; i<planned; ++i) {
        intervals.push_back(sample_intervals(f.series_length, f.nb_intervals, f.min_interval, prng));
      }
      std::vector<size_t> seeds;
      seeds.reserve(planned);
      for (size_t i = 0; i<planned; ++i) { seeds.push_back(prng()); }

      // --- --- --- Fit the members
      // Each task writes in its own slot: no lock needed, except for the log
      std::vector<std::optional<FittedMember>> slots(planned);
      std::vector<std::exception_ptr> errors(planned);
      std::atomic<bool> failed{false};
      std::mutex log_mutex;

      auto mk_task = [&](size_t idx) {
        return [&, idx]() {
          try {
            auto tstart = utils::now();
            slots[idx] = fit_member(*base_learner, seeds[idx], panel, encoded, nb_classes, intervals[idx]);
            if (log!=nullptr) {
              auto delta = utils::now() - tstart;
              std::lock_guard lock(log_mutex);
              auto cf = log->fill();
              *log << std::setfill('0') << std::setw(3) << idx + 1 << " / " << planned;
              log->fill(cf);
              *log << "   timing: " << utils::as_string(delta) << std::endl;
            }
          } catch (std::exception const& e) {
            errors[idx] = std::make_exception_ptr(WorkerFitError(idx, e.what()));
            failed = true;
          } catch (...) {
            errors[idx] = std::current_exception();
            failed = true;
          }
        };
      };

      // Members are dispatched in index order: the dispatched members always form a prefix.
      // Under a time limit, the first member is always dispatched.
      std::optional<utils::duration_t> budget;
      if (config.time_limit_in_minutes) { budget = utils::from_minutes(config.time_limit_in_minutes.value()); }
      size_t nb_dispatched = 0;

      auto generator = [&]() -> std::optional<utils::ParTasks::task_t> {
        if (nb_dispatched>=planned || failed) { return {}; }
        if (budget && nb_dispatched>0 && utils::now() - start_time>budget.value()) { return {}; }
        return utils::ParTasks::task_t(mk_task(nb_dispatched++));
      };

      utils::ParTasks p;
      p.execute(config.nb_threads, generator);

      // --- --- --- Report the first failure, without touching the current state
      for (auto const& e : errors) { if (e) { std::rethrow_exception(e); }}

      f.members.reserve(nb_dispatched);
      for (size_t i = 0; i<nb_dispatched; ++i) {
        if (!slots[i]) { utils::should_not_happen("dispatched member without result"); }
        f.members.push_back(std::move(slots[i].value()));
      }
      f.fit_time = utils::now() - start_time;

      if (log!=nullptr) {
        *log << "Fitted " << f.members.size() << " / " << planned << " trees in " << utils::as_string(f.fit_time)
             << std::endl;
      }

      // --- --- --- Commit
      fitted = std::move(f);
    }

    // --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- ---
    // Predict
    // --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- ---

    arma::mat predict_proba(SeriesPanel const& panel) const {
      Fitted const& f = get_fitted("predict_proba");
      const size_t nb_classes = f.encoder.size();
      if (panel.empty()) { return arma::mat(0, nb_classes); }
      if (panel.length()!=f.series_length) {
        throw ConfigurationError(
          "Forest fitted on series of length " + std::to_string(f.series_length) + ", got "
          + std::to_string(panel.length())
        );
      }

      const size_t nb_members = f.members.size();
      std::vector<arma::mat> probas(nb_members);
      std::vector<std::exception_ptr> errors(nb_members);

      auto task = [&](size_t idx) {
        try {
          probas[idx] = member_predict_proba(f.members[idx], panel);
        } catch (...) {
          errors[idx] = std::current_exception();
        }
      };

      utils::ParTasks p;
      for (size_t i = 0; i<nb_members; ++i) { p.push_task(task, i); }
      p.execute(config.nb_threads);

      for (auto const& e : errors) { if (e) { std::rethrow_exception(e); }}

      // Sum in member order, independently of the completion order
      arma::mat result(panel.size(), nb_classes, arma::fill::zeros);
      for (auto const& pr : probas) { result += pr; }
      result /= (double)nb_members;
      return result;
    }

  };


  // --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- ---
  // Public interface
  // --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- --- ---

  TimeSeriesForest::TimeSeriesForest(TSFConfig config, std::shared_ptr<const learner::i_BaseLearner> base_learner) :
    pImpl(std::make_unique<Impl>(std::move(config), std::move(base_learner))) {}

  TimeSeriesForest::~TimeSeriesForest() = default;

  TimeSeriesForest::TimeSeriesForest(TimeSeriesForest&& other) noexcept = default;

  TimeSeriesForest& TimeSeriesForest::operator =(TimeSeriesForest&& other) noexcept = default;

  void TimeSeriesForest::set_log(std::ostream *out) { pImpl->log = out; }

  TSFConfig const& TimeSeriesForest::config() const { return pImpl->config; }

  learner::i_BaseLearner const& TimeSeriesForest::base_learner() const { return *pImpl->base_learner; }

  void TimeSeriesForest::fit(SeriesPanel const& panel, std::vector<L> const& labels) { pImpl->fit(panel, labels); }

  bool TimeSeriesForest::is_fitted() const { return pImpl->fitted.has_value(); }

  arma::mat TimeSeriesForest::predict_proba(SeriesPanel const& panel) const { return pImpl->predict_proba(panel); }

  std::vector<L> TimeSeriesForest::predict(SeriesPanel const& panel) const {
    const arma::mat probas = predict_proba(panel);
    LabelEncoder const& encoder = pImpl->fitted->encoder;
    std::vector<L> result;
    result.reserve(probas.n_rows);
    for (size_t r = 0; r<probas.n_rows; ++r) {
      size_t best = 0;
      for (size_t c = 1; c<probas.n_cols; ++c) { if (probas(r, c)>probas(r, best)) { best = c; }}
      result.push_back(encoder.decode(best));
    }
    return result;
  }

  double TimeSeriesForest::score(SeriesPanel const& panel, std::vector<L> const& labels) const {
    if (labels.size()!=panel.size()) {
      throw ConfigurationError(
        "Got " + std::to_string(labels.size()) + " labels for " + std::to_string(panel.size()) + " series"
      );
    }
    const std::vector<L> predicted = predict(panel);
    if (predicted.empty()) { return 0; }
    size_t nb_correct = 0;
    for (size_t i = 0; i<predicted.size(); ++i) { if (predicted[i]==labels[i]) { ++nb_correct; }}
    return (double)nb_correct/(double)predicted.size();
  }

  FittedParams TimeSeriesForest::get_fitted_params() const {
    auto const& f = pImpl->get_fitted("get_fitted_params");
    FittedParams result;
    result.classes = f.encoder.index_to_label();
    result.intervals.reserve(f.members.size());
    result.estimators.reserve(f.members.size());
    for (auto const& m : f.members) {
      result.intervals.push_back(m.intervals);
      result.estimators.push_back(m.estimator);
    }
    return result;
  }

  std::vector<L> const& TimeSeriesForest::classes() const {
    return pImpl->get_fitted("classes").encoder.index_to_label();
  }

  size_t TimeSeriesForest::nb_classes() const { return pImpl->get_fitted("nb_classes").encoder.size(); }

  size_t TimeSeriesForest::series_length() const { return pImpl->get_fitted("series_length").series_length; }

  size_t TimeSeriesForest::nb_intervals() const { return pImpl->get_fitted("nb_intervals").nb_intervals; }

  size_t TimeSeriesForest::min_interval() const { return pImpl->get_fitted("min_interval").min_interval; }

  size_t TimeSeriesForest::nb_members() const { return pImpl->get_fitted("nb_members").members.size(); }

  std::vector<FittedMember> const& TimeSeriesForest::members() const { return pImpl->get_fitted("members").members; }

  size_t TimeSeriesForest::seed() const { return pImpl->get_fitted("seed").seed; }

  utils::duration_t TimeSeriesForest::fit_time() const { return pImpl->get_fitted("fit_time").fit_time; }

  TemporalCurves TimeSeriesForest::temporal_curves() const {
    auto const& f = pImpl->get_fitted("temporal_curves");
    return compute_curves(f.members, f.series_length);
  }

  Json::Value TimeSeriesForest::to_json() const {
    Json::Value j;
    j["classifier"] = "TimeSeriesForest";
    j["config"] = pImpl->config.to_json();
    j["base_learner"] = pImpl->base_learner->to_json();
    j["fitted"] = is_fitted();
    if (is_fitted()) {
      auto const& f = pImpl->fitted.value();
      Json::Value classes(Json::arrayValue);
      for (auto const& l : f.encoder.index_to_label()) { classes.append(l); }
      j["classes"] = classes;
      j["series_length"] = Json::UInt64(f.series_length);
      j["nb_intervals"] = Json::UInt64(f.nb_intervals);
      j["min_interval"] = Json::UInt64(f.min_interval);
      j["seed"] = Json::UInt64(f.seed);
      j["nb_members"] = Json::UInt64(f.members.size());
      Json::Value intervals(Json::arrayValue);
      for (auto const& m : f.members) { intervals.append(transform::to_json(m.intervals)); }
      j["intervals"] = intervals;
      j["fit_time_ns"] = Json::Int64(std::chrono::duration_cast<std::chrono::nanoseconds>(f.fit_time).count());
      j["fit_time_human"] = utils::as_string(f.fit_time);
    }
    return j;
  }

} // End of namespace tsforest::classifier::TSF
