#include "safcast/model/forecast.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

#include "safcast/core/error.hpp"
#include "safcast/core/logging.hpp"

namespace safcast {

void ForecastInputs::validate_or_throw() const {
  SAFCAST_ENSURE(std::isfinite(base_demand_mt), ErrorCode::kInvalidInput,
                 "ForecastInputs: base_demand_mt must be finite");
  SAFCAST_ENSURE(base_demand_mt >= 0.0, ErrorCode::kInvalidInput,
                 "ForecastInputs: base_demand_mt must be >= 0");
  SAFCAST_ENSURE(std::isfinite(annual_growth_rate), ErrorCode::kInvalidInput,
                 "ForecastInputs: annual_growth_rate must be finite");
  SAFCAST_ENSURE(annual_growth_rate >= -1.0, ErrorCode::kInvalidInput,
                 "ForecastInputs: annual_growth_rate must be >= -1");
}

DemandSeries ForecastBreakdown::series() const {
  SAFCAST_ENSURE(rows.size() == horizon::kYears, ErrorCode::kMalformedSeries,
                 "ForecastBreakdown: row count does not match the horizon");
  YearArray total{};
  for (std::size_t i = 0; i < rows.size(); ++i) total[i] = rows[i].total_demand_mt;
  return DemandSeries(total);
}

ForecastBreakdown project_breakdown(const ForecastInputs& in, const AssumptionSet& a) {
  in.validate_or_throw();
  a.efficiency.validate_or_throw();

  const EfficiencySettings& eff = a.efficiency;
  const double ramp_per_year = eff.operational_max_gain / static_cast<double>(eff.operational_ramp_years);

  ForecastBreakdown out;
  out.inputs = in;
  out.rows.reserve(horizon::kYears);

  for (std::size_t i = 0; i < horizon::kYears; ++i) {
    const double n = static_cast<double>(i);

    ForecastRow r;
    r.year = horizon::year_at(i);
    r.raw_demand_mt = in.base_demand_mt * std::pow(1.0 + in.annual_growth_rate, n);
    r.tech_efficiency_factor = std::pow(1.0 - eff.tech_gain_per_year, n);
    r.demand_after_tech_mt = r.raw_demand_mt * r.tech_efficiency_factor;

    if (in.apply_operational_gains) {
      r.operational_efficiency_factor = 1.0 - std::min(eff.operational_max_gain, ramp_per_year * n);
    } else {
      r.operational_efficiency_factor = 1.0;
    }
    r.total_demand_mt = r.demand_after_tech_mt * r.operational_efficiency_factor;
    SAFCAST_ENSURE(std::isfinite(r.raw_demand_mt) && std::isfinite(r.total_demand_mt), ErrorCode::kInvalidInput,
                   "project_breakdown: demand overflows in " + std::to_string(r.year) +
                       " (base demand or growth rate too large)");

    out.rows.push_back(r);
  }

  if (log_enabled(LogLevel::DEBUG)) {
    std::ostringstream oss;
    oss << "forecast: base=" << in.base_demand_mt << " Mt growth=" << in.annual_growth_rate
        << " ops=" << (in.apply_operational_gains ? "on" : "off")
        << " -> " << horizon::kEndYear << " demand=" << out.rows.back().total_demand_mt << " Mt";
    log_debug(oss.str());
  }
  return out;
}

DemandSeries project_demand(const ForecastInputs& in, const AssumptionSet& a) {
  return project_breakdown(in, a).series();
}

DemandSeries project_demand(double base_demand_mt,
                            double annual_growth_rate,
                            bool apply_operational_gains,
                            const AssumptionSet& a) {
  ForecastInputs in;
  in.base_demand_mt = base_demand_mt;
  in.annual_growth_rate = annual_growth_rate;
  in.apply_operational_gains = apply_operational_gains;
  return project_demand(in, a);
}

}  // namespace safcast
