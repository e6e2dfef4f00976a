#pragma once
/*
================================================================================
Fragment 2.2 - Model: Fuel Demand Forecast
FILE: cpp/safcast/model/forecast.hpp

Purpose:
  - Project yearly fuel demand from a base-year value.

Model (i = years since horizon start):
  raw[i]   = base * (1 + growth)^i                          traffic growth
  tech[i]  = (1 - tech_gain)^i                              fleet renewal, always on
  op[i]    = 1 - min(max_gain, (max_gain / ramp_years) * i) only with operational gains,
             else 1
  total[i] = raw[i] * tech[i] * op[i]

Errors (kInvalidInput):
  - base demand negative or non-finite
  - growth rate non-finite or below -1 (would yield negative demand)
  - inputs so large that a projected year overflows

Pure function of its inputs and the AssumptionSet.
================================================================================
*/

#include <vector>

#include "safcast/core/assumptions.hpp"
#include "safcast/model/demand_series.hpp"

namespace safcast {

struct ForecastInputs {
  double base_demand_mt = 0.0;       // fuel demand in the first horizon year (Mt)
  double annual_growth_rate = 0.0;   // traffic growth, e.g. 0.025
  bool apply_operational_gains = false;

  void validate_or_throw() const;
};

struct ForecastRow {
  int year = 0;
  double raw_demand_mt = 0.0;
  double tech_efficiency_factor = 1.0;
  double demand_after_tech_mt = 0.0;
  double operational_efficiency_factor = 1.0;
  double total_demand_mt = 0.0;
};

struct ForecastBreakdown {
  ForecastInputs inputs;
  std::vector<ForecastRow> rows;  // one per horizon year, ascending

  DemandSeries series() const;
};

ForecastBreakdown project_breakdown(const ForecastInputs& in, const AssumptionSet& a);

DemandSeries project_demand(const ForecastInputs& in, const AssumptionSet& a);

DemandSeries project_demand(double base_demand_mt,
                            double annual_growth_rate,
                            bool apply_operational_gains,
                            const AssumptionSet& a);

}  // namespace safcast
