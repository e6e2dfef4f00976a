#include "safcast/model/summary.hpp"

#include <cmath>
#include <limits>
#include <utility>

#include "safcast/core/error.hpp"

namespace safcast {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double pearson(const std::vector<double>& x, const std::vector<double>& y) {
  const std::size_t n = x.size();
  if (n < 2 || y.size() != n) return kNaN;

  double mx = 0.0;
  double my = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    mx += x[i];
    my += y[i];
  }
  mx /= static_cast<double>(n);
  my /= static_cast<double>(n);

  double sxy = 0.0;
  double sxx = 0.0;
  double syy = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double dx = x[i] - mx;
    const double dy = y[i] - my;
    sxy += dx * dy;
    sxx += dx * dx;
    syy += dy * dy;
  }
  if (!(sxx > 0.0) || !(syy > 0.0)) return kNaN;
  return sxy / std::sqrt(sxx * syy);
}

}  // namespace

ScenarioSummary summarize(const ScenarioResult& r, std::string label) {
  ScenarioSummary s;
  s.label = std::move(label);
  s.scenario = r.scenario();

  for (const auto& row : r.rows()) {
    s.cumulative_demand_mt += row.total_demand_mt;
    s.cumulative_saf_mt += row.saf_volume_mt;
    s.cumulative_co2_generated_mt += row.co2_generated_mt;
    s.cumulative_co2_avoided_mt += row.co2_avoided_mt;
    s.cumulative_fuel_cost_bn += row.fuel_cost_bn;
    s.cumulative_carbon_cost_bn += row.carbon_cost_bn;
    s.cumulative_total_cost_bn += row.total_cost_bn;
  }

  const ScenarioRow& last = r.rows().back();
  s.final_share_pct = last.saf_share_pct;
  s.final_co2_generated_mt = last.co2_generated_mt;
  return s;
}

ScenarioComparison compare(const ScenarioSummary& baseline, const ScenarioSummary& candidate) {
  ScenarioComparison c;
  c.baseline_label = baseline.label;
  c.candidate_label = candidate.label;
  c.delta_total_cost_bn = candidate.cumulative_total_cost_bn - baseline.cumulative_total_cost_bn;
  c.delta_co2_generated_mt = candidate.cumulative_co2_generated_mt - baseline.cumulative_co2_generated_mt;

  const double reduction = -c.delta_co2_generated_mt;
  c.abatement_cost_bn_per_mt = (reduction > 0.0) ? c.delta_total_cost_bn / reduction : kNaN;
  return c;
}

std::vector<std::vector<double>> correlation_matrix(const ScenarioResult& r,
                                                    const std::vector<Column>& columns) {
  SAFCAST_ENSURE(!columns.empty(), ErrorCode::kInvalidInput, "correlation_matrix: no columns");

  std::vector<std::vector<double>> data;
  data.reserve(columns.size());
  for (Column c : columns) {
    SAFCAST_ENSURE(c < Column::Count, ErrorCode::kInvalidInput, "correlation_matrix: invalid column");
    data.push_back(r.column(c));
  }

  const std::size_t k = columns.size();
  std::vector<std::vector<double>> m(k, std::vector<double>(k, kNaN));
  for (std::size_t i = 0; i < k; ++i) {
    for (std::size_t j = i; j < k; ++j) {
      const double v = pearson(data[i], data[j]);
      m[i][j] = v;
      m[j][i] = v;
    }
  }
  return m;
}

}  // namespace safcast
