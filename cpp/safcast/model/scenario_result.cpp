#include "safcast/model/scenario_result.hpp"

#include <string>
#include <utility>

#include "safcast/core/error.hpp"
#include "safcast/core/horizon.hpp"

namespace safcast {

namespace {

constexpr std::array<std::string_view, kColumnCount> kNames{
    "Total_Fuel_Demand_Mt",
    "SAF_Blending_Share_%",
    "SAF_Volume_Mt",
    "Jet_Fuel_Volume_Mt",
    "CO2_Emissions_Generated_Mt",
    "CO2_Emissions_Avoided_Mt",
    "Carbon_Price_EUR_per_Ton",
    "Total_Fuel_Cost_EUR_Bn",
    "Carbon_Cost_EUR_Bn",
    "Total_Cost_of_Compliance_EUR_Bn",
};

}  // namespace

const std::array<Column, kColumnCount>& all_columns() noexcept {
  static const std::array<Column, kColumnCount> cols = [] {
    std::array<Column, kColumnCount> c{};
    for (std::size_t i = 0; i < kColumnCount; ++i) c[i] = static_cast<Column>(i);
    return c;
  }();
  return cols;
}

std::string_view column_name(Column c) noexcept {
  const auto i = static_cast<std::size_t>(c);
  return i < kNames.size() ? kNames[i] : std::string_view{};
}

std::optional<Column> find_column(std::string_view name) noexcept {
  for (std::size_t i = 0; i < kNames.size(); ++i) {
    if (kNames[i] == name) return static_cast<Column>(i);
  }
  return std::nullopt;
}

double column_value(const ScenarioRow& r, Column c) noexcept {
  switch (c) {
    case Column::TotalDemand:        return r.total_demand_mt;
    case Column::SafShare:           return r.saf_share_pct;
    case Column::SafVolume:          return r.saf_volume_mt;
    case Column::ConventionalVolume: return r.conventional_volume_mt;
    case Column::Co2Generated:       return r.co2_generated_mt;
    case Column::Co2Avoided:         return r.co2_avoided_mt;
    case Column::CarbonPrice:        return r.carbon_price_per_t;
    case Column::FuelCost:           return r.fuel_cost_bn;
    case Column::CarbonCost:         return r.carbon_cost_bn;
    case Column::TotalCost:          return r.total_cost_bn;
    default:                         return 0.0;
  }
}

ScenarioResult::ScenarioResult(ScenarioId scenario, std::vector<ScenarioRow> rows)
    : scenario_(scenario), rows_(std::move(rows)) {
  SAFCAST_ENSURE(rows_.size() == horizon::kYears, ErrorCode::kInternal,
                 "ScenarioResult: expected one row per horizon year");
  for (std::size_t i = 0; i < rows_.size(); ++i) {
    SAFCAST_ENSURE(rows_[i].year == horizon::year_at(i), ErrorCode::kInternal,
                   "ScenarioResult: rows out of year order");
  }
}

const ScenarioRow& ScenarioResult::at_year(int year) const {
  SAFCAST_ENSURE(horizon::contains(year), ErrorCode::kInvalidInput,
                 "ScenarioResult::at_year: year " + std::to_string(year) + " outside horizon");
  return rows_[horizon::offset(year)];
}

std::vector<double> ScenarioResult::column(Column c) const {
  std::vector<double> out;
  out.reserve(rows_.size());
  for (const auto& r : rows_) out.push_back(column_value(r, c));
  return out;
}

std::vector<double> ScenarioResult::column(std::string_view name) const {
  const auto c = find_column(name);
  if (!c) {
    SAFCAST_THROW(ErrorCode::kInvalidInput, "unknown result column '" + std::string(name) + "'");
  }
  return column(*c);
}

}  // namespace safcast
