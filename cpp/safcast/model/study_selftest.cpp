/*
  Study Runner Selftest

  Checks
  ------
    1) Standard study: S0/S1 on the base forecast, S2 with operational gains.
    2) Parallel batches are bit-identical to serial ones and keep input order,
       also when helper threads cannot be started.
    3) Invalid cases abort the batch before any work.
    4) Summaries, comparisons and correlation matrix.

  Framework-free; non-zero return code indicates failure.
*/

#include <cmath>
#include <exception>
#include <functional>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include "safcast/core/assumptions.hpp"
#include "safcast/core/error.hpp"
#include "safcast/model/fingerprint.hpp"
#include "safcast/model/study.hpp"
#include "safcast/model/summary.hpp"

namespace safcast {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void test_standard_study() {
  const AssumptionSet a = default_assumptions();
  const std::vector<CaseResult> res = run_standard_study(80.0, 0.025, a);

  expect_true(res.size() == 3, "standard study has three cases");
  expect_true(res[0].label == "S0" && res[1].label == "S1" && res[2].label == "S2", "labels follow scenario codes");
  expect_true(!res[0].forecast.apply_operational_gains && !res[1].forecast.apply_operational_gains,
              "S0 and S1 use the base forecast");
  expect_true(res[2].forecast.apply_operational_gains, "S2 uses the forecast with operational gains");

  expect_true(res[0].key.run_id() != res[1].key.run_id(), "run ids differ per scenario");
  expect_true(res[1].key.run_id().rfind("S1__a_", 0) == 0, "run id starts with the scenario code");
}

void test_parallel_matches_serial() {
  const AssumptionSet a = default_assumptions();
  SweepSpec spec;
  spec.base_demand_mt = 80.0;
  spec.growth_rates = {0.0, 0.01, 0.02, 0.025, 0.03, 0.04, 0.05};
  spec.scenarios = {ScenarioId::S0, ScenarioId::S1, ScenarioId::S2};
  const std::vector<EvaluationCase> cases = make_sweep_cases(spec);
  expect_true(cases.size() == 21, "sweep has growth x scenario cases");
  expect_true(cases[4].label == "S1@g=0.01", "sweep labels are growth-major");

  BatchOptions serial;
  serial.max_threads = 1;
  BatchOptions parallel;
  parallel.max_threads = 4;

  const std::vector<CaseResult> r1 = run_cases(cases, a, serial);
  const std::vector<CaseResult> r4 = run_cases(cases, a, parallel);

  bool same = r1.size() == cases.size() && r4.size() == cases.size();
  for (std::size_t i = 0; same && i < cases.size(); ++i) {
    same = r1[i].label == cases[i].label && r4[i].label == cases[i].label &&
           hash_result(r1[i].result) == hash_result(r4[i].result) &&
           r1[i].key.combined_h == r4[i].key.combined_h;
  }
  expect_true(same, "parallel batch equals serial batch in order and content");

  expect_true(run_cases({}, a, parallel).empty(), "empty batch returns no results");
}

void test_thread_start_failure() {
  const AssumptionSet a = default_assumptions();
  SweepSpec spec;
  spec.base_demand_mt = 75.0;
  spec.growth_rates = {0.01, 0.02, 0.03, 0.04};
  spec.scenarios = {ScenarioId::S0, ScenarioId::S1, ScenarioId::S2};
  const std::vector<EvaluationCase> cases = make_sweep_cases(spec);

  BatchOptions serial;
  serial.max_threads = 1;
  const std::vector<CaseResult> ref = run_cases(cases, a, serial);

  auto same_as_ref = [&](const std::vector<CaseResult>& got) {
    if (got.size() != ref.size()) return false;
    for (std::size_t i = 0; i < ref.size(); ++i) {
      if (got[i].label != ref[i].label || hash_result(got[i].result) != hash_result(ref[i].result)) return false;
    }
    return true;
  };

  // Two helpers start, the third hits the thread limit.
  int launched = 0;
  BatchOptions limited;
  limited.max_threads = 8;
  limited.launch_thread = [&launched](std::function<void()> task) {
    if (launched == 2) throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    ++launched;
    return std::thread(std::move(task));
  };
  try {
    expect_true(same_as_ref(run_cases(cases, a, limited)), "batch completes when the thread limit is hit");
  } catch (const std::exception& e) {
    fail(std::string("thread limit must not abort the batch: ") + e.what());
  }
  expect_true(launched == 2, "helpers started before the limit were used");

  BatchOptions none;
  none.max_threads = 4;
  none.launch_thread = [](std::function<void()>) -> std::thread {
    throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
  };
  try {
    expect_true(same_as_ref(run_cases(cases, a, none)), "batch falls back to the calling thread");
  } catch (const std::exception& e) {
    fail(std::string("no helper thread must not abort the batch: ") + e.what());
  }
}

void test_batch_validation() {
  const AssumptionSet a = default_assumptions();

  std::vector<EvaluationCase> cases(3);
  for (auto& c : cases) {
    c.forecast.base_demand_mt = 70.0;
    c.forecast.annual_growth_rate = 0.02;
  }
  cases[2].forecast.base_demand_mt = -4.0;
  try {
    (void)run_cases(cases, a);
    fail("batch with an invalid case must throw");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kInvalidInput, "invalid forecast aborts the batch");
  }

  cases[2].forecast.base_demand_mt = 70.0;
  cases[1].scenario = static_cast<ScenarioId>(5);
  try {
    (void)run_cases(cases, a);
    fail("batch with an unknown scenario must throw");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kUnknownScenario, "unknown scenario aborts the batch");
  }

  SweepSpec empty;
  empty.base_demand_mt = 80.0;
  empty.scenarios = {ScenarioId::S0};
  try {
    (void)make_sweep_cases(empty);
    fail("sweep without growth rates must throw");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kInvalidInput, "sweep without growth rates rejected");
  }
}

void test_summary_and_comparison() {
  const AssumptionSet a = default_assumptions();
  const std::vector<CaseResult> res = run_standard_study(80.0, 0.025, a);

  const ScenarioSummary s0 = summarize(res[0].result, res[0].label);
  const ScenarioSummary s1 = summarize(res[1].result, res[1].label);
  const ScenarioSummary s2 = summarize(res[2].result, res[2].label);

  double co2 = 0.0;
  for (const auto& row : res[1].result.rows()) co2 += row.co2_generated_mt;
  expect_true(std::fabs(s1.cumulative_co2_generated_mt - co2) <= 1e-9, "cumulative CO2 sums every year");
  expect_true(std::fabs(s1.final_share_pct - 70.0) <= 1e-9, "final S1 share is the 2050 mandate");
  expect_true(s1.cumulative_co2_generated_mt < s0.cumulative_co2_generated_mt, "mandate emits less than voluntary");
  expect_true(s2.cumulative_co2_generated_mt < s1.cumulative_co2_generated_mt, "operational gains emit less still");

  const ScenarioComparison c = compare(s0, s1);
  expect_true(c.delta_co2_generated_mt < 0.0, "S1 reduces CO2 against S0");
  expect_true(std::isfinite(c.abatement_cost_bn_per_mt), "abatement cost defined when CO2 falls");

  const ScenarioComparison self = compare(s0, s0);
  expect_true(std::isnan(self.abatement_cost_bn_per_mt), "abatement cost NaN without reduction");
}

void test_correlation() {
  const AssumptionSet a = default_assumptions();
  const std::vector<CaseResult> res = run_standard_study(80.0, 0.025, a);

  const std::vector<Column> cols = {Column::TotalDemand, Column::SafShare, Column::CarbonPrice, Column::SafVolume};
  const auto m = correlation_matrix(res[1].result, cols);
  expect_true(m.size() == 4 && m[0].size() == 4, "matrix is columns x columns");

  bool diag = true;
  bool symmetric = true;
  for (std::size_t i = 0; i < m.size(); ++i) {
    diag = diag && std::fabs(m[i][i] - 1.0) <= 1e-12;
    for (std::size_t j = 0; j < m.size(); ++j) symmetric = symmetric && m[i][j] == m[j][i];
  }
  expect_true(diag, "diagonal is 1");
  expect_true(symmetric, "matrix is symmetric");
  expect_true(std::fabs(m[2][1]) <= 1.0 && m[2][1] > 0.9, "share and carbon price move together under the mandate");

  // S0 share is constant, so its correlations are undefined.
  const auto m0 = correlation_matrix(res[0].result, {Column::SafShare, Column::TotalDemand});
  expect_true(std::isnan(m0[0][1]) && std::isnan(m0[0][0]), "constant column yields NaN");
}

}  // namespace
}  // namespace safcast

int main() {
  using namespace safcast;

  test_standard_study();
  test_parallel_matches_serial();
  test_thread_start_failure();
  test_batch_validation();
  test_summary_and_comparison();
  test_correlation();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
