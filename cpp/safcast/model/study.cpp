#include "safcast/model/study.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <limits>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

#include "safcast/core/error.hpp"
#include "safcast/core/logging.hpp"
#include "safcast/model/evaluator.hpp"

namespace safcast {

namespace {

CaseResult run_one(const EvaluationCase& c, const AssumptionSet& a) {
  const DemandSeries demand = project_demand(c.forecast, a);
  return CaseResult{c.label, c.forecast, make_run_key(a, c.forecast, c.scenario),
                    evaluate_scenario(demand, c.scenario, a)};
}

std::size_t resolve_thread_count(std::size_t requested, std::size_t n_cases) {
  std::size_t n = requested;
  if (n == 0) {
    const unsigned hc = std::thread::hardware_concurrency();
    n = (hc > 0) ? static_cast<std::size_t>(hc) : 1;
  }
  return std::max<std::size_t>(1, std::min(n, n_cases));
}

// Joins every started helper, also while unwinding.
class HelperThreads {
 public:
  explicit HelperThreads(std::size_t capacity) { threads_.reserve(capacity); }
  ~HelperThreads() { join(); }

  HelperThreads(const HelperThreads&) = delete;
  HelperThreads& operator=(const HelperThreads&) = delete;

  void add(std::thread t) { threads_.push_back(std::move(t)); }
  std::size_t size() const { return threads_.size(); }

  void join() {
    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
  }

 private:
  std::vector<std::thread> threads_;
};

}  // namespace

std::vector<CaseResult> run_cases(const std::vector<EvaluationCase>& cases,
                                  const AssumptionSet& a,
                                  const BatchOptions& opt) {
  a.validate_or_throw();
  for (const auto& c : cases) {
    c.forecast.validate_or_throw();
    SAFCAST_ENSURE(is_known_scenario(c.scenario), ErrorCode::kUnknownScenario,
                   "run_cases: case '" + c.label + "' has an unknown scenario");
  }

  std::vector<CaseResult> out;
  if (cases.empty()) return out;

  const std::size_t n_threads = resolve_thread_count(opt.max_threads, cases.size());
  log_info("run_cases: " + std::to_string(cases.size()) + " case(s) on " +
           std::to_string(n_threads) + " thread(s)");

  out.reserve(cases.size());
  if (n_threads == 1) {
    for (const auto& c : cases) out.push_back(run_one(c, a));
    return out;
  }

  std::vector<std::optional<CaseResult>> slots(cases.size());
  std::atomic<std::size_t> next{0};
  std::atomic<bool> failed{false};
  std::mutex err_mu;
  std::exception_ptr first_error;
  std::size_t first_error_index = std::numeric_limits<std::size_t>::max();

  auto work = [&]() {
    for (;;) {
      if (failed.load(std::memory_order_relaxed)) return;
      const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
      if (i >= cases.size()) return;
      try {
        slots[i].emplace(run_one(cases[i], a));
      } catch (...) {
        std::lock_guard<std::mutex> lk(err_mu);
        if (i < first_error_index) {
          first_error_index = i;
          first_error = std::current_exception();
        }
        failed.store(true, std::memory_order_relaxed);
      }
    }
  };

  const std::function<void()> task = work;
  HelperThreads helpers(n_threads - 1);
  for (std::size_t t = 0; t + 1 < n_threads; ++t) {
    try {
      helpers.add(opt.launch_thread ? opt.launch_thread(task) : std::thread(task));
    } catch (const std::system_error& e) {
      log_warn("run_cases: could not start worker thread (" + std::string(e.what()) + "); continuing on " +
               std::to_string(helpers.size() + 1) + " thread(s)");
      break;
    }
  }
  work();  // calling thread participates
  helpers.join();

  if (first_error) {
    log_error("run_cases: case '" + cases[first_error_index].label + "' failed; batch aborted");
    std::rethrow_exception(first_error);
  }

  for (auto& s : slots) {
    SAFCAST_ENSURE(s.has_value(), ErrorCode::kInternal, "run_cases: missing result slot");
    out.push_back(std::move(*s));
  }
  return out;
}

std::vector<EvaluationCase> standard_study_cases(double base_demand_mt, double annual_growth_rate) {
  std::vector<EvaluationCase> cases;
  cases.reserve(kScenarioCount);
  for (ScenarioId id : all_scenarios()) {
    const ScenarioDefinition& def = scenario_definition(id);
    EvaluationCase c;
    c.label = def.code;
    c.forecast.base_demand_mt = base_demand_mt;
    c.forecast.annual_growth_rate = annual_growth_rate;
    c.forecast.apply_operational_gains = def.operational_gains;
    c.scenario = id;
    cases.push_back(std::move(c));
  }
  return cases;
}

std::vector<CaseResult> run_standard_study(double base_demand_mt,
                                           double annual_growth_rate,
                                           const AssumptionSet& a) {
  BatchOptions opt;
  opt.max_threads = 1;
  return run_cases(standard_study_cases(base_demand_mt, annual_growth_rate), a, opt);
}

std::vector<EvaluationCase> make_sweep_cases(const SweepSpec& spec) {
  SAFCAST_ENSURE(!spec.growth_rates.empty(), ErrorCode::kInvalidInput, "make_sweep_cases: no growth rates");
  SAFCAST_ENSURE(!spec.scenarios.empty(), ErrorCode::kInvalidInput, "make_sweep_cases: no scenarios");

  std::vector<EvaluationCase> cases;
  cases.reserve(spec.growth_rates.size() * spec.scenarios.size());
  for (double g : spec.growth_rates) {
    for (ScenarioId id : spec.scenarios) {
      const ScenarioDefinition& def = scenario_definition(id);
      EvaluationCase c;
      std::ostringstream label;
      label << def.code << "@g=" << g;
      c.label = label.str();
      c.forecast.base_demand_mt = spec.base_demand_mt;
      c.forecast.annual_growth_rate = g;
      c.forecast.apply_operational_gains = def.operational_gains;
      c.scenario = id;
      cases.push_back(std::move(c));
    }
  }
  return cases;
}

}  // namespace safcast
