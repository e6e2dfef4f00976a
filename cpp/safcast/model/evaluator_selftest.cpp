/*
  Scenario Evaluator Selftest

  Checks
  ------
    1) Reference year: 100 Mt base, no growth, S0 in 2026.
    2) Closed scenario set: unknown tokens and out-of-range ids are rejected
       before computation.
    3) Row invariants over every scenario: non-negative values, volume
       conservation, share bound, cost identity.
    4) Mandate control years resolve exactly; S1 dominates S0 after 2025.
    5) Result columns are addressable by their stable names.

  Framework-free; non-zero return code indicates failure.
*/

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

#include "safcast/core/assumptions.hpp"
#include "safcast/core/error.hpp"
#include "safcast/model/evaluator.hpp"
#include "safcast/model/forecast.hpp"
#include "safcast/model/scenario.hpp"
#include "safcast/model/scenario_result.hpp"

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

void expect_rel(double got, double expected, double rel_tol, std::string_view msg) {
  const double scale = std::max(std::fabs(expected), 1e-300);
  if (!(std::fabs(got - expected) / scale <= rel_tol)) {
    fail(msg);
    std::cerr << "  got: " << got << "  expected: " << expected << "\n";
  } else {
    pass(msg);
  }
}

template <class Fn>
void expect_error(Fn&& fn, ErrorCode expected, std::string_view msg) {
  try {
    fn();
    fail(msg);
  } catch (const Error& e) {
    if (e.code() == expected) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  wrong code: " << to_string(e.code()) << "\n";
    }
  }
}

void test_reference_year() {
  const AssumptionSet a = default_assumptions();
  const DemandSeries d = project_demand(100.0, 0.0, false, a);
  const ScenarioResult r = evaluate_scenario(d, "S0", a);
  const ScenarioRow& row = r.at_year(2026);

  expect_rel(row.total_demand_mt, 98.5, 1e-3, "2026 demand 98.5 Mt");
  expect_rel(row.saf_share_pct, 1.0, 1e-12, "S0 share 1%");
  expect_rel(row.saf_volume_mt, 0.985, 1e-3, "SAF volume 0.985 Mt");
  expect_rel(row.conventional_volume_mt, 97.515, 1e-3, "conventional volume 97.515 Mt");
  expect_rel(row.co2_generated_mt, 308.77, 1e-3, "CO2 generated 308.77 Mt");
  expect_rel(row.co2_avoided_mt, 2.49, 1e-3, "CO2 avoided 2.49 Mt");
  expect_rel(row.carbon_price_per_t, 82.8, 1e-12, "carbon price 82.8");
  expect_rel(row.carbon_cost_bn, 0.000025566, 1e-3, "carbon cost 2.5566e-5 bn");
  expect_rel(row.fuel_cost_bn, 0.0001000, 1e-3, "fuel cost 1.0e-4 bn");
  expect_rel(row.total_cost_bn, 0.00012554, 1e-3, "total cost 1.2554e-4 bn");
}

void test_unknown_scenario() {
  const AssumptionSet a = default_assumptions();
  const DemandSeries d = project_demand(80.0, 0.02, false, a);

  expect_error([&] { (void)evaluate_scenario(d, "S9", a); }, ErrorCode::kUnknownScenario, "token S9 rejected");
  expect_error([&] { (void)evaluate_scenario(d, "", a); }, ErrorCode::kUnknownScenario, "empty token rejected");
  expect_error([&] { (void)evaluate_scenario(d, static_cast<ScenarioId>(9), a); }, ErrorCode::kUnknownScenario,
               "out-of-range id rejected");

  // Scenario check comes before assumption validation.
  AssumptionSet broken = a;
  broken.prices.saf_premium = -1.0;
  expect_error([&] { (void)evaluate_scenario(d, "S7", broken); }, ErrorCode::kUnknownScenario,
               "unknown scenario reported before invalid assumptions");
  expect_error([&] { (void)evaluate_scenario(d, ScenarioId::S1, broken); }, ErrorCode::kInvalidConfig,
               "invalid assumptions rejected");

  expect_true(try_parse_scenario_id(" s2 ").value_or(ScenarioId::S0) == ScenarioId::S2,
              "scenario tokens are case-insensitive and trimmed");
  expect_true(std::string(to_string(static_cast<ScenarioId>(9))) == "S?", "unknown id prints as S?");
}

void test_row_invariants() {
  const AssumptionSet a = default_assumptions();
  for (bool ops : {false, true}) {
    const DemandSeries d = project_demand(85.0, 0.03, ops, a);
    for (ScenarioId id : all_scenarios()) {
      const ScenarioResult r = evaluate_scenario(d, id, a);
      bool ok = r.size() == 26;
      for (const auto& row : r.rows()) {
        for (Column c : all_columns()) ok = ok && column_value(row, c) >= 0.0;
        ok = ok && std::fabs(row.saf_volume_mt + row.conventional_volume_mt - row.total_demand_mt) <=
                       1e-9 * std::max(1.0, row.total_demand_mt);
        ok = ok && row.saf_share_pct >= 0.0 && row.saf_share_pct <= 100.0;
        ok = ok && std::fabs(row.total_cost_bn - (row.fuel_cost_bn + row.carbon_cost_bn)) <= 1e-15;
      }
      const std::string msg = std::string("row invariants hold for ") + to_string(id) + (ops ? " (ops)" : "");
      expect_true(ok, msg);
    }
  }
}

void test_mandate_scenarios() {
  const AssumptionSet a = default_assumptions();
  const DemandSeries d = project_demand(80.0, 0.025, false, a);
  const ScenarioResult s0 = evaluate_scenario(d, ScenarioId::S0, a);
  const ScenarioResult s1 = evaluate_scenario(d, ScenarioId::S1, a);
  const ScenarioResult s2 = evaluate_scenario(d, ScenarioId::S2, a);

  expect_rel(s1.at_year(2030).saf_share_pct, 6.0, 1e-12, "S1 share in 2030 is 6%");
  expect_rel(s1.at_year(2050).saf_share_pct, 70.0, 1e-12, "S1 share in 2050 is 70%");

  const YearArray shares = resolve_saf_shares(ScenarioId::S1, a);
  expect_true(shares[horizon::offset(2030)] == 0.06, "resolved 2030 share is exactly 0.06");
  expect_true(shares[horizon::offset(2035)] == 0.20, "resolved 2035 share is exactly 0.20");

  bool dominates = true;
  for (int y = 2026; y <= horizon::kEndYear; ++y) {
    dominates = dominates && s1.at_year(y).saf_volume_mt >= s0.at_year(y).saf_volume_mt;
  }
  expect_true(dominates, "S1 SAF volume >= S0 after 2025");

  bool same_policy = true;
  for (std::size_t i = 0; i < s1.size(); ++i) {
    same_policy = same_policy && s1.rows()[i].saf_share_pct == s2.rows()[i].saf_share_pct;
  }
  expect_true(same_policy, "S2 uses the mandate shares of S1");

  const ScenarioResult s2_ops = evaluate_scenario(project_demand(80.0, 0.025, true, a), ScenarioId::S2, a);
  expect_true(s2_ops.at_year(2050).co2_generated_mt < s1.at_year(2050).co2_generated_mt,
              "operational gains cut 2050 emissions under the mandate");
}

void test_column_access() {
  const AssumptionSet a = default_assumptions();
  const ScenarioResult r = evaluate_scenario(project_demand(80.0, 0.02, false, a), ScenarioId::S1, a);

  expect_true(column_name(Column::SafShare) == "SAF_Blending_Share_%", "share column name is stable");
  expect_true(column_name(Column::TotalCost) == "Total_Cost_of_Compliance_EUR_Bn", "total cost name is stable");
  expect_true(find_column("CO2_Emissions_Avoided_Mt") == Column::Co2Avoided, "find_column resolves names");
  expect_true(!find_column("Year").has_value(), "Year is not a value column");

  const auto by_name = r.column("SAF_Volume_Mt");
  const auto by_enum = r.column(Column::SafVolume);
  expect_true(by_name == by_enum && by_name.size() == 26, "column by name equals column by enum");

  expect_error([&] { (void)r.column("Biofuel_Mt"); }, ErrorCode::kInvalidInput, "unknown column name rejected");
  expect_error([&] { (void)r.at_year(2024); }, ErrorCode::kInvalidInput, "year before horizon rejected");
}

}  // namespace
}  // namespace safcast

int main() {
  using namespace safcast;

  test_reference_year();
  test_unknown_scenario();
  test_row_invariants();
  test_mandate_scenarios();
  test_column_access();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
