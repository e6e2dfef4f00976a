/*
  Demand Forecast Selftest

  Checks
  ------
    1) Technology gain compounds from the horizon start (2025 = base).
    2) Operational gains ramp linearly and hold at the cap after the ramp.
    3) Zero base demand stays zero.
    4) Invalid inputs, and inputs whose projection overflows, fail with kInvalidInput.
    5) Identical inputs give bit-identical series.
    6) DemandSeries rejects malformed year/value sets.

  Framework-free; non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string_view>
#include <utility>
#include <vector>

#include "safcast/core/assumptions.hpp"
#include "safcast/core/error.hpp"
#include "safcast/model/demand_series.hpp"
#include "safcast/model/fingerprint.hpp"
#include "safcast/model/forecast.hpp"

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

void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  got: " << a << "  expected: " << b << "\n";
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

void test_tech_gain() {
  const AssumptionSet a = default_assumptions();
  const DemandSeries d = project_demand(100.0, 0.0, false, a);

  expect_true(d.size() == 26, "26 horizon years");
  expect_near(d.at_year(2025), 100.0, 0.0, "2025 equals base demand");
  expect_near(d.at_year(2026), 98.5, 1e-9, "2026 = 100 * 0.985");
  expect_near(d.at_year(2050), 100.0 * std::pow(0.985, 25.0), 1e-9, "2050 compounds 25 years of tech gain");

  const DemandSeries g = project_demand(100.0, 0.03, false, a);
  expect_near(g.at_year(2026), 100.0 * 1.03 * 0.985, 1e-9, "growth and tech gain multiply");

  expect_error([&] { (void)d.at_year(2051); }, ErrorCode::kInvalidInput, "at_year outside horizon rejected");
}

void test_operational_ramp() {
  const AssumptionSet a = default_assumptions();
  ForecastInputs in;
  in.base_demand_mt = 80.0;
  in.annual_growth_rate = 0.025;
  in.apply_operational_gains = true;
  const ForecastBreakdown f = project_breakdown(in, a);

  expect_true(f.rows.size() == 26, "breakdown has one row per year");
  expect_near(f.rows[0].operational_efficiency_factor, 1.0, 0.0, "no operational gain in 2025");
  expect_near(f.rows[5].operational_efficiency_factor, 1.0 - 0.07 / 15.0 * 5.0, 1e-12, "2030 one third of the ramp");
  expect_near(f.rows[15].operational_efficiency_factor, 0.93, 1e-12, "full 7% gain reached in 2040");
  expect_near(f.rows[25].operational_efficiency_factor, 0.93, 1e-12, "gain clamps at 7% after 2040");

  bool consistent = true;
  for (const auto& r : f.rows) {
    consistent = consistent &&
                 std::fabs(r.total_demand_mt -
                           r.raw_demand_mt * r.tech_efficiency_factor * r.operational_efficiency_factor) <= 1e-9;
  }
  expect_true(consistent, "total = raw * tech * operational in every row");

  in.apply_operational_gains = false;
  const ForecastBreakdown base = project_breakdown(in, a);
  bool lower = true;
  for (std::size_t i = 1; i < base.rows.size(); ++i) {
    lower = lower && f.rows[i].total_demand_mt < base.rows[i].total_demand_mt;
  }
  expect_true(lower, "operational gains lower demand after 2025");
}

void test_zero_base() {
  const DemandSeries d = project_demand(0.0, 0.05, true, default_assumptions());
  bool all_zero = true;
  for (double v : d.values()) all_zero = all_zero && v == 0.0;
  expect_true(all_zero, "zero base demand stays zero");
}

void test_invalid_inputs() {
  const AssumptionSet a = default_assumptions();
  const double nan = std::numeric_limits<double>::quiet_NaN();

  expect_error([&] { (void)project_demand(-1.0, 0.02, false, a); }, ErrorCode::kInvalidInput,
               "negative base demand rejected");
  expect_error([&] { (void)project_demand(nan, 0.02, false, a); }, ErrorCode::kInvalidInput,
               "NaN base demand rejected");
  expect_error([&] { (void)project_demand(80.0, nan, false, a); }, ErrorCode::kInvalidInput,
               "NaN growth rejected");
  expect_error([&] { (void)project_demand(80.0, -1.5, false, a); }, ErrorCode::kInvalidInput,
               "growth below -1 rejected");

  expect_error([&] { (void)project_demand(80.0, 1e20, false, a); }, ErrorCode::kInvalidInput,
               "growth that overflows the horizon rejected as input");
  expect_error([&] { (void)project_demand(std::numeric_limits<double>::max(), 0.05, false, a); },
               ErrorCode::kInvalidInput, "base demand that overflows rejected as input");

  const DemandSeries collapse = project_demand(80.0, -1.0, false, a);
  expect_near(collapse.at_year(2030), 0.0, 0.0, "growth of -1 collapses demand to zero");
}

void test_determinism() {
  const AssumptionSet a = default_assumptions();
  const DemandSeries d1 = project_demand(92.4, 0.031, true, a);
  const DemandSeries d2 = project_demand(92.4, 0.031, true, a);
  expect_true(hash_demand(d1) == hash_demand(d2), "identical inputs give identical series");

  const DemandSeries d3 = project_demand(92.4, 0.031, false, a);
  expect_true(hash_demand(d1) != hash_demand(d3), "operational flag changes the series");
}

void test_demand_series_construction() {
  std::vector<std::pair<int, double>> rows;
  for (int y = 2050; y >= 2025; --y) rows.push_back({y, static_cast<double>(y - 2000)});
  const DemandSeries d = DemandSeries::from_year_values(rows);
  expect_near(d.at_year(2025), 25.0, 0.0, "rows in any order are placed by year");

  auto missing = rows;
  missing.pop_back();
  expect_error([&] { (void)DemandSeries::from_year_values(missing); }, ErrorCode::kMalformedSeries,
               "missing year rejected");

  auto dup = rows;
  dup.push_back({2030, 1.0});
  expect_error([&] { (void)DemandSeries::from_year_values(dup); }, ErrorCode::kMalformedSeries,
               "duplicate year rejected");

  auto outside = rows;
  outside.push_back({2051, 1.0});
  expect_error([&] { (void)DemandSeries::from_year_values(outside); }, ErrorCode::kMalformedSeries,
               "year outside horizon rejected");

  YearArray neg{};
  neg[3] = -0.5;
  expect_error([&] { DemandSeries s(neg); (void)s; }, ErrorCode::kMalformedSeries, "negative demand rejected");
}

}  // namespace
}  // namespace safcast

int main() {
  using namespace safcast;

  test_tech_gain();
  test_operational_ramp();
  test_zero_base();
  test_invalid_inputs();
  test_determinism();
  test_demand_series_construction();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
