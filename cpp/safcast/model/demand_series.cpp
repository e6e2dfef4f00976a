#include "safcast/model/demand_series.hpp"

#include <array>
#include <cmath>
#include <string>

#include "safcast/core/error.hpp"

namespace safcast {

DemandSeries::DemandSeries(const YearArray& total_demand_mt) : values_(total_demand_mt) {
  for (std::size_t i = 0; i < values_.size(); ++i) {
    SAFCAST_ENSURE(std::isfinite(values_[i]) && values_[i] >= 0.0, ErrorCode::kMalformedSeries,
                   "DemandSeries: demand for " + std::to_string(horizon::year_at(i)) +
                       " must be finite and >= 0");
  }
}

DemandSeries DemandSeries::from_year_values(const std::vector<std::pair<int, double>>& rows) {
  YearArray values{};
  std::array<bool, horizon::kYears> seen{};

  for (const auto& [year, value] : rows) {
    SAFCAST_ENSURE(horizon::contains(year), ErrorCode::kMalformedSeries,
                   "DemandSeries: year " + std::to_string(year) + " outside horizon " +
                       std::to_string(horizon::kStartYear) + "-" + std::to_string(horizon::kEndYear));
    const std::size_t i = horizon::offset(year);
    SAFCAST_ENSURE(!seen[i], ErrorCode::kMalformedSeries,
                   "DemandSeries: duplicate year " + std::to_string(year));
    seen[i] = true;
    values[i] = value;
  }

  for (std::size_t i = 0; i < seen.size(); ++i) {
    SAFCAST_ENSURE(seen[i], ErrorCode::kMalformedSeries,
                   "DemandSeries: missing year " + std::to_string(horizon::year_at(i)));
  }
  return DemandSeries(values);
}

double DemandSeries::at_year(int year) const {
  SAFCAST_ENSURE(horizon::contains(year), ErrorCode::kInvalidInput,
                 "DemandSeries::at_year: year " + std::to_string(year) + " outside horizon");
  return values_[horizon::offset(year)];
}

}  // namespace safcast
