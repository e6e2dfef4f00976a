/*
================================================================================
Fragment 4.0 - CLI: Main Entry Point (safcast_cli)
FILE: cpp/cli/main.cpp

Purpose:
  - Command-line front end for the SAF scenario model:
    * Demand forecast
    * Single scenario evaluation (forecast or CSV demand input)
    * Standard three-scenario study with CSV artifacts
    * Growth-rate sweeps across scenarios
    * Effective assumptions dump

Usage:
  safcast_cli <command> [options]

Hardening:
  - Explicit exit codes for CI integration
  - No silent failures
  - Deterministic output format
================================================================================
*/

#include "safcast/core/assumptions.hpp"
#include "safcast/core/config.hpp"
#include "safcast/core/error.hpp"
#include "safcast/core/hashing.hpp"
#include "safcast/core/logging.hpp"
#include "safcast/exports/demand_csv.hpp"
#include "safcast/exports/scenario_csv.hpp"
#include "safcast/model/evaluator.hpp"
#include "safcast/model/fingerprint.hpp"
#include "safcast/model/forecast.hpp"
#include "safcast/model/study.hpp"
#include "safcast/model/summary.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace safcast;

namespace {

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  VALIDATION_FAILED = 2,
  COMPUTATION_FAILED = 3,
  IO_ERROR = 4
};

constexpr int kSampleYears[] = {2025, 2030, 2035, 2040, 2050};

void print_help() {
  std::cout << R"(
safcast_cli - Aviation SAF adoption scenario model (2025-2050)

Usage:
  safcast_cli <command> [options]

Commands:
  forecast      Project yearly fuel demand
  evaluate      Evaluate one scenario (S0, S1, S2)
  study         Run the standard study (S0/S1 base demand, S2 with operational gains)
  sweep         Evaluate scenarios across a list of growth rates
  assumptions   Print the effective model assumptions
  help          Show this help message

Options:
  --base-demand <Mt>       Fuel demand in 2025 (forecast, evaluate, study, sweep)
  --growth <rate>          Annual traffic growth, e.g. 0.025
  --ops                    Apply operational efficiency gains (forecast, evaluate)
  --scenario <S0|S1|S2>    Scenario to evaluate (evaluate)
  --demand-csv <path>      Read the demand series instead of forecasting (evaluate)
  --growth-list <a,b,..>   Growth rates to sweep (sweep)
  --scenarios <S0,S1,..>   Scenarios to sweep (sweep, default all)
  --threads <n>            Worker threads, 0 = hardware (sweep, default 0)
  --out <path>             CSV output file (forecast, evaluate, sweep)
  --out-dir <dir>          CSV output directory (study)
  --config <path>          Assumption overrides file (key = value)
  --log-level <lvl>        debug | info | warn | error (default info)

Examples:
  safcast_cli forecast --base-demand 80 --growth 0.025 --ops
  safcast_cli evaluate --scenario S1 --base-demand 80 --growth 0.025 --out s1.csv
  safcast_cli study --base-demand 80 --growth 0.025 --out-dir results
  safcast_cli sweep --base-demand 80 --growth-list 0.01,0.025,0.04 --threads 4 --out sweep.csv

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - Validation failed
  3 - Computation failed
  4 - I/O error
)";
}

struct Args {
  std::string command;

  std::optional<double> base_demand_mt;
  std::optional<double> growth;
  bool ops = false;
  std::string scenario;
  std::string demand_csv;
  std::vector<double> growth_list;
  std::vector<std::string> scenarios;
  std::size_t threads = 0;

  std::string out_path;
  std::string out_dir;
  std::string config_path;
};

bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

std::vector<std::string> split_list(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(cur);
  return out;
}

bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

bool parse_args(int argc, char** argv, Args* a, std::string* err) {
  a->command = (argc >= 2) ? std::string(argv[1]) : "help";

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    if (std::strcmp(k, "--ops") == 0) {
      a->ops = true;
      continue;
    }

    if (std::strcmp(k, "--base-demand") == 0 || std::strcmp(k, "--growth") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = std::string(k) + " requires a value"; return false; }
      double d = 0.0;
      if (!parse_double(v, &d)) { *err = std::string(k) + " must be a finite number"; return false; }
      if (std::strcmp(k, "--base-demand") == 0) a->base_demand_mt = d;
      else a->growth = d;
      continue;
    }

    if (std::strcmp(k, "--growth-list") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--growth-list requires a value"; return false; }
      for (const auto& item : split_list(v)) {
        double d = 0.0;
        if (!parse_double(item.c_str(), &d)) { *err = "--growth-list entry '" + item + "' is not a number"; return false; }
        a->growth_list.push_back(d);
      }
      continue;
    }

    if (std::strcmp(k, "--scenarios") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--scenarios requires a value"; return false; }
      a->scenarios = split_list(v);
      continue;
    }

    if (std::strcmp(k, "--threads") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--threads requires a value"; return false; }
      double d = 0.0;
      if (!parse_double(v, &d) || d < 0.0 || d != std::floor(d) || d > 1024.0) {
        *err = "--threads must be an integer in [0,1024]";
        return false;
      }
      a->threads = static_cast<std::size_t>(d);
      continue;
    }

    if (std::strcmp(k, "--log-level") == 0) {
      if (!get_next(i, argc, argv, &v)) { *err = "--log-level requires a value"; return false; }
      LogLevel lvl = LogLevel::INFO;
      if (!parse_log_level(v, &lvl)) { *err = "--log-level must be debug|info|warn|error"; return false; }
      set_log_level(lvl);
      continue;
    }

    std::string* target = nullptr;
    if (std::strcmp(k, "--scenario") == 0) target = &a->scenario;
    else if (std::strcmp(k, "--demand-csv") == 0) target = &a->demand_csv;
    else if (std::strcmp(k, "--out") == 0) target = &a->out_path;
    else if (std::strcmp(k, "--out-dir") == 0) target = &a->out_dir;
    else if (std::strcmp(k, "--config") == 0) target = &a->config_path;

    if (target) {
      if (!get_next(i, argc, argv, &v)) { *err = std::string(k) + " requires a value"; return false; }
      *target = v;
      continue;
    }

    *err = std::string("Unknown argument: ") + k;
    return false;
  }
  return true;
}

bool require_forecast_args(const Args& a, std::string* err) {
  if (!a.base_demand_mt) { *err = "Missing --base-demand"; return false; }
  if (!a.growth) { *err = "Missing --growth"; return false; }
  return true;
}

AssumptionSet effective_assumptions(const Args& a) {
  if (a.config_path.empty()) return default_assumptions();
  return load_assumptions_file(a.config_path, default_assumptions());
}

int exit_code_for(const Error& e) {
  switch (e.code()) {
    case ErrorCode::kIoError:
      return IO_ERROR;
    case ErrorCode::kInvalidInput:
    case ErrorCode::kUnknownScenario:
    case ErrorCode::kMalformedSeries:
    case ErrorCode::kInvalidConfig:
    case ErrorCode::kParseError:
      return VALIDATION_FAILED;
    default:
      return COMPUTATION_FAILED;
  }
}

void print_result_rows(const ScenarioResult& r, bool samples_only) {
  std::cout << std::left << std::setw(6) << "Year" << std::right
            << std::setw(10) << "Demand" << std::setw(9) << "SAF%"
            << std::setw(10) << "SAF_Mt" << std::setw(10) << "Jet_Mt"
            << std::setw(10) << "CO2_Mt" << std::setw(10) << "Avoid_Mt"
            << std::setw(9) << "CO2_px" << std::setw(12) << "Total_Bn" << "\n";

  std::cout << std::fixed << std::setprecision(2);
  for (const auto& row : r.rows()) {
    if (samples_only) {
      bool sample = false;
      for (int y : kSampleYears) sample = sample || (y == row.year);
      if (!sample) continue;
    }
    std::cout << std::left << std::setw(6) << row.year << std::right
              << std::setw(10) << row.total_demand_mt << std::setw(9) << row.saf_share_pct
              << std::setw(10) << row.saf_volume_mt << std::setw(10) << row.conventional_volume_mt
              << std::setw(10) << row.co2_generated_mt << std::setw(10) << row.co2_avoided_mt
              << std::setw(9) << row.carbon_price_per_t
              << std::setw(12) << std::setprecision(6) << row.total_cost_bn << std::setprecision(2) << "\n";
  }
  std::cout.unsetf(std::ios::floatfield);
  std::cout.precision(6);
}

int cmd_forecast(const Args& a) {
  std::string err;
  if (!require_forecast_args(a, &err)) {
    std::cerr << err << "\n";
    return INVALID_ARGS;
  }

  const AssumptionSet assumptions = effective_assumptions(a);
  ForecastInputs in;
  in.base_demand_mt = *a.base_demand_mt;
  in.annual_growth_rate = *a.growth;
  in.apply_operational_gains = a.ops;

  const ForecastBreakdown f = project_breakdown(in, assumptions);

  std::cout << "=== Fuel Demand Forecast ===\n";
  std::cout << "Base demand: " << in.base_demand_mt << " Mt, growth: " << in.annual_growth_rate * 100.0
            << "%/yr, operational gains: " << (in.apply_operational_gains ? "on" : "off") << "\n";
  std::cout << std::fixed << std::setprecision(4);
  for (const auto& r : f.rows) {
    std::cout << r.year << "  raw=" << r.raw_demand_mt << "  tech=" << r.tech_efficiency_factor
              << "  ops=" << r.operational_efficiency_factor << "  total=" << r.total_demand_mt << "\n";
  }
  std::cout.unsetf(std::ios::floatfield);
  std::cout.precision(6);

  if (!a.out_path.empty()) {
    if (!write_forecast_csv_file(f, a.out_path)) return IO_ERROR;
    std::cout << "Wrote " << a.out_path << "\n";
  }
  return SUCCESS;
}

int cmd_evaluate(const Args& a) {
  if (a.scenario.empty()) {
    std::cerr << "Missing --scenario\n";
    return INVALID_ARGS;
  }
  // Reject the scenario token before loading or computing anything.
  const ScenarioId id = parse_scenario_id(a.scenario);
  const AssumptionSet assumptions = effective_assumptions(a);

  std::optional<DemandSeries> demand;
  if (!a.demand_csv.empty()) {
    demand.emplace(load_demand_csv_file(a.demand_csv));
  } else {
    std::string err;
    if (!require_forecast_args(a, &err)) {
      std::cerr << err << " (or pass --demand-csv)\n";
      return INVALID_ARGS;
    }
    demand.emplace(project_demand(*a.base_demand_mt, *a.growth, a.ops, assumptions));
  }

  const ScenarioResult r = evaluate_scenario(*demand, id, assumptions);
  const ScenarioDefinition& def = scenario_definition(id);

  std::cout << "=== Scenario " << def.code << ": " << def.title << " ===\n";
  std::cout << "Assumptions: " << hash_to_hex(hash_assumptions(assumptions))
            << "  Result: " << hash_to_hex(hash_result(r)) << "\n";
  print_result_rows(r, false);

  if (!a.out_path.empty()) {
    if (!write_scenario_csv_file(r, a.out_path)) return IO_ERROR;
    std::cout << "Wrote " << a.out_path << "\n";
  }
  return SUCCESS;
}

int cmd_study(const Args& a) {
  std::string err;
  if (!require_forecast_args(a, &err)) {
    std::cerr << err << "\n";
    return INVALID_ARGS;
  }

  const AssumptionSet assumptions = effective_assumptions(a);
  const std::vector<CaseResult> results = run_standard_study(*a.base_demand_mt, *a.growth, assumptions);

  std::cout << "=== Standard Study ===\n";
  std::cout << "Base demand: " << *a.base_demand_mt << " Mt, growth: " << *a.growth * 100.0 << "%/yr\n";
  std::cout << "Assumptions: " << hash_to_hex(hash_assumptions(assumptions)) << "\n";

  std::vector<ScenarioSummary> summaries;
  for (const auto& c : results) {
    const ScenarioDefinition& def = scenario_definition(c.result.scenario());
    std::cout << "\n--- " << def.code << ": " << def.title << " (" << c.key.run_id() << ") ---\n";
    print_result_rows(c.result, true);
    summaries.push_back(summarize(c.result, c.label));
  }

  std::cout << "\n--- Cumulative 2025-2050 vs " << summaries.front().label << " ---\n";
  std::cout << std::fixed << std::setprecision(3);
  for (std::size_t i = 1; i < summaries.size(); ++i) {
    const ScenarioComparison cmp = compare(summaries.front(), summaries[i]);
    std::cout << cmp.candidate_label << ": dCO2=" << cmp.delta_co2_generated_mt << " Mt"
              << "  dCost=" << std::setprecision(6) << cmp.delta_total_cost_bn << " Bn"
              << "  cost/Mt avoided=" << cmp.abatement_cost_bn_per_mt << std::setprecision(3) << "\n";
  }
  std::cout.unsetf(std::ios::floatfield);
  std::cout.precision(6);

  if (!a.out_dir.empty()) {
    const std::string dir = a.out_dir + "/";
    bool ok = true;
    for (const auto& c : results) {
      ok = write_scenario_csv_file(c.result, dir + "scenario_" + c.label + ".csv") && ok;
    }
    ok = write_metric_comparison_csv_file(results, Column::Co2Generated, dir + "co2_generated_by_scenario.csv") && ok;
    ok = write_metric_comparison_csv_file(results, Column::TotalCost, dir + "total_cost_by_scenario.csv") && ok;
    ok = write_summary_csv_file(summaries, dir + "summary.csv") && ok;
    if (!ok) return IO_ERROR;
    std::cout << "Wrote study CSVs to " << a.out_dir << "\n";
  }
  return SUCCESS;
}

int cmd_sweep(const Args& a) {
  if (!a.base_demand_mt) {
    std::cerr << "Missing --base-demand\n";
    return INVALID_ARGS;
  }
  if (a.growth_list.empty()) {
    std::cerr << "Missing --growth-list\n";
    return INVALID_ARGS;
  }

  SweepSpec spec;
  spec.base_demand_mt = *a.base_demand_mt;
  spec.growth_rates = a.growth_list;
  if (a.scenarios.empty()) {
    spec.scenarios.assign(all_scenarios().begin(), all_scenarios().end());
  } else {
    for (const auto& token : a.scenarios) spec.scenarios.push_back(parse_scenario_id(token));
  }

  const AssumptionSet assumptions = effective_assumptions(a);
  BatchOptions opt;
  opt.max_threads = a.threads;
  const std::vector<CaseResult> results = run_cases(make_sweep_cases(spec), assumptions, opt);

  std::vector<ScenarioSummary> summaries;
  summaries.reserve(results.size());
  for (const auto& c : results) summaries.push_back(summarize(c.result, c.label));

  std::cout << "=== Growth Sweep (" << results.size() << " cases) ===\n";
  std::cout << std::fixed << std::setprecision(3);
  for (const auto& s : summaries) {
    std::cout << std::left << std::setw(16) << s.label << std::right
              << "  CO2=" << std::setw(10) << s.cumulative_co2_generated_mt << " Mt"
              << "  avoided=" << std::setw(9) << s.cumulative_co2_avoided_mt << " Mt"
              << "  cost=" << std::setprecision(6) << s.cumulative_total_cost_bn << std::setprecision(3) << " Bn\n";
  }
  std::cout.unsetf(std::ios::floatfield);
  std::cout.precision(6);

  if (!a.out_path.empty()) {
    if (!write_summary_csv_file(summaries, a.out_path)) return IO_ERROR;
    std::cout << "Wrote " << a.out_path << "\n";
  }
  return SUCCESS;
}

int cmd_assumptions(const Args& a) {
  const AssumptionSet assumptions = effective_assumptions(a);
  std::cout << "# assumptions hash " << hash_to_hex(hash_assumptions(assumptions)) << "\n";
  std::cout << format_assumptions(assumptions);
  return SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  std::string err;
  if (!parse_args(argc, argv, &args, &err)) {
    std::cerr << err << "\n";
    std::cerr << "Run 'safcast_cli help' for usage information.\n";
    return INVALID_ARGS;
  }

  const std::string& cmd = args.command;
  if (cmd == "help" || cmd == "-h" || cmd == "--help") {
    print_help();
    return SUCCESS;
  }

  try {
    if (cmd == "forecast") return cmd_forecast(args);
    if (cmd == "evaluate") return cmd_evaluate(args);
    if (cmd == "study") return cmd_study(args);
    if (cmd == "sweep") return cmd_sweep(args);
    if (cmd == "assumptions") return cmd_assumptions(args);
  } catch (const Error& e) {
    log_error(e.what());
    return exit_code_for(e);
  } catch (const std::exception& e) {
    log_error(std::string("unexpected failure: ") + e.what());
    return COMPUTATION_FAILED;
  }

  std::cerr << "Unknown command: " << cmd << "\n";
  std::cerr << "Run 'safcast_cli help' for usage information.\n";
  return INVALID_ARGS;
}
