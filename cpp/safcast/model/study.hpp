#pragma once
/*
================================================================================
Fragment 2.7 - Model: Study Runner (Case Batches, Standard Study, Sweeps)
FILE: cpp/safcast/model/study.hpp

Purpose:
  - Evaluate many (forecast inputs, scenario) cases against one AssumptionSet.
  - Standard study: S0 and S1 on the base forecast, S2 on the forecast with
    operational efficiency gains.
  - Growth-rate sweeps across scenarios.

Concurrency:
  - Cases are independent; the AssumptionSet is shared read-only.
  - Workers claim case indices from an atomic counter and write only their own
    result slot, so output order always equals input order and results are
    bit-identical to a serial run.
  - If a helper thread cannot be started (std::system_error), the batch goes on
    with the threads already running plus the calling thread.
  - All cases are validated before any worker starts. If a case still fails,
    the error of the lowest failing index is rethrown and no results are
    returned.
================================================================================
*/

#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "safcast/core/assumptions.hpp"
#include "safcast/model/fingerprint.hpp"
#include "safcast/model/forecast.hpp"
#include "safcast/model/scenario.hpp"
#include "safcast/model/scenario_result.hpp"

namespace safcast {

struct EvaluationCase {
  std::string label;
  ForecastInputs forecast;
  ScenarioId scenario = ScenarioId::S0;
};

struct CaseResult {
  std::string label;
  ForecastInputs forecast;
  RunKey key;
  ScenarioResult result;
};

// Starts one helper thread running `task`.
using ThreadLauncher = std::function<std::thread(std::function<void()> task)>;

struct BatchOptions {
  // 0 = std::thread::hardware_concurrency(); 1 = run on the calling thread.
  std::size_t max_threads = 0;

  // Empty = plain std::thread.
  ThreadLauncher launch_thread;
};

std::vector<CaseResult> run_cases(const std::vector<EvaluationCase>& cases,
                                  const AssumptionSet& a,
                                  const BatchOptions& opt = BatchOptions());

// Cases for S0, S1, S2 labelled by scenario code, each with its standard
// operational-gains flag.
std::vector<EvaluationCase> standard_study_cases(double base_demand_mt, double annual_growth_rate);

std::vector<CaseResult> run_standard_study(double base_demand_mt,
                                           double annual_growth_rate,
                                           const AssumptionSet& a);

struct SweepSpec {
  double base_demand_mt = 0.0;
  std::vector<double> growth_rates;
  std::vector<ScenarioId> scenarios;
};

// Growth-major order; labels look like "S1@g=0.025".
std::vector<EvaluationCase> make_sweep_cases(const SweepSpec& spec);

}  // namespace safcast
