/*
  CSV Export / Demand Ingest Selftest

  Checks
  ------
    1) Result CSV: stable header, one line per horizon year, empty cells for NaN,
       cells that read back to the in-memory double.
    2) Metric comparison and summary layouts.
    3) Demand CSV ingest: header lookup is case-insensitive, extra columns and
       blank lines ignored, malformed input fails with the documented code.
    4) Writers report a bad path with `false` instead of throwing.

  Framework-free; non-zero return code indicates failure.
*/

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "safcast/core/assumptions.hpp"
#include "safcast/core/error.hpp"
#include "safcast/core/logging.hpp"
#include "safcast/exports/csv_format.hpp"
#include "safcast/exports/demand_csv.hpp"
#include "safcast/exports/scenario_csv.hpp"
#include "safcast/model/evaluator.hpp"
#include "safcast/model/forecast.hpp"
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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

void expect_parse_error(const std::string& csv, ErrorCode expected, std::string_view msg) {
  try {
    (void)parse_demand_csv(csv, "<test>");
    fail(msg);
  } catch (const Error& e) {
    if (e.code() == expected) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  wrong code: " << to_string(e.code()) << " (" << e.message() << ")\n";
    }
  }
}

std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream iss(text);
  std::string line;
  while (std::getline(iss, line)) out.push_back(line);
  return out;
}

std::string demand_csv_text(bool include_2040) {
  std::ostringstream o;
  o << "Year,Note,total_fuel_demand_MT\n\n";
  for (int y = 2025; y <= 2050; ++y) {
    if (y == 2040 && !include_2040) continue;
    o << y << ",\"plan, v2\"," << (70.0 + 0.5 * (y - 2025)) << "\n";
  }
  return o.str();
}

void test_scenario_csv() {
  const AssumptionSet a = default_assumptions();
  const ScenarioResult r = evaluate_scenario(project_demand(80.0, 0.025, false, a), ScenarioId::S1, a);

  expect_eq_str(scenario_csv_header(),
                "Year,Total_Fuel_Demand_Mt,SAF_Blending_Share_%,SAF_Volume_Mt,Jet_Fuel_Volume_Mt,"
                "CO2_Emissions_Generated_Mt,CO2_Emissions_Avoided_Mt,Carbon_Price_EUR_per_Ton,"
                "Total_Fuel_Cost_EUR_Bn,Carbon_Cost_EUR_Bn,Total_Cost_of_Compliance_EUR_Bn",
                "result header uses stable column names");

  const auto lines = lines_of(scenario_to_csv(r));
  expect_true(lines.size() == 27, "header plus 26 year rows");
  expect_true(lines[1].rfind("2025,80,2,", 0) == 0, "first row starts with 2025 values");
  expect_true(lines.back().rfind("2050,", 0) == 0, "last row is 2050");

  CsvExportOptions no_header;
  no_header.include_header = false;
  expect_true(lines_of(scenario_to_csv(r, no_header)).size() == 26, "header can be disabled");

  expect_eq_str(csv_double(std::numeric_limits<double>::quiet_NaN(), 0), "", "NaN exports as an empty cell");
  expect_eq_str(csv_double(2.556614938e-05, 4), "2.557e-05", "positive precision is significant digits");
  expect_eq_str(csv_escape("S1@g=0.02, high", ','), "\"S1@g=0.02, high\"", "labels with delimiters are quoted");
}

std::vector<std::string> cells_of(const std::string& line) {
  std::vector<std::string> out;
  std::istringstream iss(line);
  std::string cell;
  while (std::getline(iss, cell, ',')) out.push_back(cell);
  return out;
}

void test_cost_cells_keep_precision() {
  const AssumptionSet a = default_assumptions();
  const ScenarioResult r = evaluate_scenario(project_demand(100.0, 0.0, false, a), ScenarioId::S0, a);
  const ScenarioRow& mem = r.at_year(2026);

  const auto lines = lines_of(scenario_to_csv(r));
  const auto header = cells_of(lines[0]);
  const auto row = cells_of(lines[2]);
  expect_true(row.size() == header.size() && row[0] == "2026", "2026 row has every column");

  std::size_t carbon_idx = 0;
  std::size_t total_idx = 0;
  for (std::size_t i = 0; i < header.size(); ++i) {
    if (header[i] == "Carbon_Cost_EUR_Bn") carbon_idx = i;
    if (header[i] == "Total_Cost_of_Compliance_EUR_Bn") total_idx = i;
  }
  expect_true(carbon_idx > 0 && total_idx > 0, "cost columns present in header");

  const double carbon = std::strtod(row[carbon_idx].c_str(), nullptr);
  const double total = std::strtod(row[total_idx].c_str(), nullptr);
  expect_true(std::fabs(carbon - 2.556615e-5) <= 1e-6 * 2.556615e-5, "carbon cost cell is 2.556615e-5 bn");
  expect_true(carbon == mem.carbon_cost_bn, "carbon cost cell reads back bit-exact");
  expect_true(total == mem.total_cost_bn, "total cost cell reads back bit-exact");

  std::vector<ScenarioSummary> sums{summarize(r, "S0")};
  const auto sl = cells_of(lines_of(summaries_to_csv(sums))[1]);
  expect_true(std::strtod(sl[8].c_str(), nullptr) == sums[0].cumulative_total_cost_bn,
              "summary cumulative cost reads back bit-exact");
}

void test_comparison_and_summary_csv() {
  const AssumptionSet a = default_assumptions();
  const std::vector<CaseResult> res = run_standard_study(80.0, 0.025, a);

  const auto cmp = lines_of(metric_comparison_to_csv(res, Column::Co2Generated));
  expect_true(cmp.size() == 27, "comparison has one row per year");
  expect_eq_str(cmp[0], "Year,S0,S1,S2", "comparison header lists case labels");

  std::vector<ScenarioSummary> sums;
  for (const auto& c : res) sums.push_back(summarize(c.result, c.label));
  const auto sl = lines_of(summaries_to_csv(sums));
  expect_true(sl.size() == 4, "summary has header plus one row per case");
  expect_true(sl[2].rfind("S1,S1,", 0) == 0, "summary row carries label and scenario code");
}

void test_demand_ingest() {
  const DemandSeries d = parse_demand_csv(demand_csv_text(true), "<test>");
  expect_true(std::fabs(d.at_year(2025) - 70.0) <= 1e-12, "2025 demand read");
  expect_true(std::fabs(d.at_year(2050) - 82.5) <= 1e-12, "2050 demand read");

  const ForecastBreakdown f = project_breakdown(ForecastInputs{80.0, 0.02, true}, default_assumptions());
  const DemandSeries back = parse_demand_csv(forecast_to_csv(f));
  expect_true(back.at_year(2044) == f.rows[19].total_demand_mt, "forecast CSV reads back as a demand series");

  expect_parse_error(demand_csv_text(false), ErrorCode::kMalformedSeries, "missing year is a malformed series");
  expect_parse_error("", ErrorCode::kParseError, "empty file rejected");
  expect_parse_error("Year,Demand\n2025,1\n", ErrorCode::kParseError, "missing demand column rejected");
  expect_parse_error("Year,Total_Fuel_Demand_Mt\n2025,lots\n", ErrorCode::kParseError, "bad number rejected");
  expect_parse_error("Year,Total_Fuel_Demand_Mt\n2025.5,1\n", ErrorCode::kParseError, "fractional year rejected");
  expect_parse_error("Year,Total_Fuel_Demand_Mt\n2025\n", ErrorCode::kParseError, "short row rejected");

  try {
    (void)load_demand_csv_file("/nonexistent/safcast/demand.csv");
    fail("missing demand file must throw");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kIoError, "missing demand file is kIoError");
  }
}

void test_writer_bad_path() {
  const AssumptionSet a = default_assumptions();
  const ScenarioResult r = evaluate_scenario(project_demand(80.0, 0.0, false, a), ScenarioId::S0, a);
  expect_true(!write_scenario_csv_file(r, "/nonexistent/safcast/out.csv"), "bad output path returns false");

  const ForecastBreakdown f = project_breakdown(ForecastInputs{80.0, 0.0, false}, a);
  expect_true(!write_forecast_csv_file(f, "/nonexistent/safcast/forecast.csv"),
              "forecast writer reports a bad path too");
}

}  // namespace
}  // namespace safcast

int main() {
  using namespace safcast;

  // Quiet the batch runner's INFO lines.
  set_log_level(LogLevel::WARN);

  test_scenario_csv();
  test_cost_cells_keep_precision();
  test_comparison_and_summary_csv();
  test_demand_ingest();
  test_writer_bad_path();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
