#pragma once
/*
================================================================================
Fragment 2.5 - Model: Scenario Evaluator
FILE: cpp/safcast/model/evaluator.hpp

Purpose:
  - Apply one adoption scenario to a demand series and derive the volume split,
    emissions, carbon price and compliance costs for every horizon year.

Per year (D = total demand, s = SAF share fraction):
  SAF        = D * s
  Conv       = D - SAF
  CO2_gen    = Conv * EF_conv + SAF * EF_saf,   EF_saf = EF_conv * (1 - reduction)
  CO2_avoid  = max(0, D * EF_conv - CO2_gen)
  price      = carbon_base + carbon_slope * (year - horizon start)
  fuel_cost  = (Conv * p_conv + SAF * p_saf) / 1e9
  carb_cost  = CO2_gen * price / 1e9
  total      = fuel_cost + carb_cost

Ordering of checks (nothing is computed before all pass):
  1) scenario id       -> kUnknownScenario
  2) assumptions       -> kInvalidConfig
  3) demand values     -> kMalformedSeries
================================================================================
*/

#include <string_view>

#include "safcast/core/assumptions.hpp"
#include "safcast/core/horizon.hpp"
#include "safcast/model/demand_series.hpp"
#include "safcast/model/scenario.hpp"
#include "safcast/model/scenario_result.hpp"

namespace safcast {

// SAF share (fraction in [0,1]) for every horizon year.
YearArray resolve_saf_shares(ScenarioId id, const AssumptionSet& a);

ScenarioResult evaluate_scenario(const DemandSeries& demand,
                                 ScenarioId id,
                                 const AssumptionSet& a);

// Parses the token first; kUnknownScenario before any computation.
ScenarioResult evaluate_scenario(const DemandSeries& demand,
                                 std::string_view scenario_token,
                                 const AssumptionSet& a);

}  // namespace safcast
