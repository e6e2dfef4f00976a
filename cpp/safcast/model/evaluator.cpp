#include "safcast/model/evaluator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "safcast/core/error.hpp"
#include "safcast/core/logging.hpp"
#include "safcast/core/units.hpp"

namespace safcast {

namespace {

void check_series(const DemandSeries& demand) {
  for (std::size_t i = 0; i < demand.size(); ++i) {
    SAFCAST_ENSURE(std::isfinite(demand[i]) && demand[i] >= 0.0, ErrorCode::kMalformedSeries,
                   "evaluate_scenario: invalid demand for " + std::to_string(horizon::year_at(i)));
  }
}

}  // namespace

YearArray resolve_saf_shares(ScenarioId id, const AssumptionSet& a) {
  const ScenarioDefinition& def = scenario_definition(id);

  YearArray shares{};
  switch (def.share_policy) {
    case SharePolicy::Voluntary:
      shares.fill(std::clamp(a.adoption.voluntary_share, 0.0, 1.0));
      break;
    case SharePolicy::Mandated:
      shares = a.adoption.mandate.shares();
      break;
    default:
      SAFCAST_THROW(ErrorCode::kInternal, "resolve_saf_shares: unhandled share policy");
  }
  return shares;
}

ScenarioResult evaluate_scenario(const DemandSeries& demand, ScenarioId id, const AssumptionSet& a) {
  const ScenarioDefinition& def = scenario_definition(id);
  a.validate_or_throw();
  check_series(demand);

  const YearArray shares = resolve_saf_shares(id, a);

  const double ef_conv = a.emissions.conventional_t_per_t;
  const double ef_saf = a.emissions.saf_t_per_t();
  const double p_conv = a.prices.conventional_per_t;
  const double p_saf = a.prices.saf_per_t();

  std::vector<ScenarioRow> rows;
  rows.reserve(horizon::kYears);

  for (std::size_t i = 0; i < horizon::kYears; ++i) {
    ScenarioRow r;
    r.year = horizon::year_at(i);
    r.total_demand_mt = demand[i];
    r.saf_share_pct = units::fraction_to_percent(shares[i]);

    r.saf_volume_mt = r.total_demand_mt * shares[i];
    r.conventional_volume_mt = r.total_demand_mt - r.saf_volume_mt;

    r.co2_generated_mt = r.conventional_volume_mt * ef_conv + r.saf_volume_mt * ef_saf;
    const double co2_without_saf = r.total_demand_mt * ef_conv;
    // Floor absorbs rounding when the share is at or near zero.
    r.co2_avoided_mt = std::max(0.0, co2_without_saf - r.co2_generated_mt);

    r.carbon_price_per_t = a.carbon.price_at(r.year);

    r.fuel_cost_bn = units::to_billions(r.conventional_volume_mt * p_conv + r.saf_volume_mt * p_saf);
    r.carbon_cost_bn = units::to_billions(r.co2_generated_mt * r.carbon_price_per_t);
    r.total_cost_bn = r.fuel_cost_bn + r.carbon_cost_bn;

    rows.push_back(r);
  }

  if (log_enabled(LogLevel::DEBUG)) {
    const ScenarioRow& last = rows.back();
    std::ostringstream oss;
    oss << "evaluate " << def.code << " (" << def.title << "): " << last.year
        << " share=" << last.saf_share_pct << "% co2=" << last.co2_generated_mt
        << " Mt total_cost=" << last.total_cost_bn << " bn";
    log_debug(oss.str());
  }

  return ScenarioResult(id, std::move(rows));
}

ScenarioResult evaluate_scenario(const DemandSeries& demand,
                                 std::string_view scenario_token,
                                 const AssumptionSet& a) {
  return evaluate_scenario(demand, parse_scenario_id(scenario_token), a);
}

}  // namespace safcast
