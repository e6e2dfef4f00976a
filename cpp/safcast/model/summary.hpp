#pragma once
/*
================================================================================
Fragment 2.8 - Model: Horizon Summaries + Scenario Comparison
FILE: cpp/safcast/model/summary.hpp

Purpose:
  - Collapse a result table into horizon-cumulative totals for reporting.
  - Compare a candidate scenario against a baseline (incremental cost of the
    emissions it avoids).
  - Pearson correlation between result columns (the input of a correlation
    heatmap; rendering is not done here).

NaN conventions:
  - abatement cost is NaN when the candidate avoids no CO2 versus the baseline.
  - correlation entries touching a constant column are NaN.
================================================================================
*/

#include <string>
#include <vector>

#include "safcast/model/scenario.hpp"
#include "safcast/model/scenario_result.hpp"

namespace safcast {

struct ScenarioSummary {
  std::string label;
  ScenarioId scenario = ScenarioId::S0;

  double cumulative_demand_mt = 0.0;
  double cumulative_saf_mt = 0.0;
  double cumulative_co2_generated_mt = 0.0;
  double cumulative_co2_avoided_mt = 0.0;
  double cumulative_fuel_cost_bn = 0.0;
  double cumulative_carbon_cost_bn = 0.0;
  double cumulative_total_cost_bn = 0.0;

  double final_share_pct = 0.0;
  double final_co2_generated_mt = 0.0;
};

ScenarioSummary summarize(const ScenarioResult& r, std::string label);

struct ScenarioComparison {
  std::string baseline_label;
  std::string candidate_label;
  double delta_total_cost_bn = 0.0;        // candidate - baseline
  double delta_co2_generated_mt = 0.0;     // candidate - baseline
  double abatement_cost_bn_per_mt = 0.0;   // delta cost / CO2 reduction
};

ScenarioComparison compare(const ScenarioSummary& baseline, const ScenarioSummary& candidate);

// Row-major columns.size() x columns.size() matrix.
std::vector<std::vector<double>> correlation_matrix(const ScenarioResult& r,
                                                    const std::vector<Column>& columns);

}  // namespace safcast
