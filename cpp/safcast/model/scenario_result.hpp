#pragma once
/*
================================================================================
Fragment 2.4 - Model: Scenario Result Table
FILE: cpp/safcast/model/scenario_result.hpp

Purpose:
  - Year-indexed output of one (demand series, scenario) evaluation.
  - Stable column names so exporters and chart consumers can address columns
    by name without knowing how values were derived.

Units:
  - share in percent, volumes and CO2 in Mt, carbon price per tCO2,
    costs in billions.
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "safcast/model/scenario.hpp"

namespace safcast {

struct ScenarioRow {
  int year = 0;
  double total_demand_mt = 0.0;
  double saf_share_pct = 0.0;
  double saf_volume_mt = 0.0;
  double conventional_volume_mt = 0.0;
  double co2_generated_mt = 0.0;
  double co2_avoided_mt = 0.0;
  double carbon_price_per_t = 0.0;
  double fuel_cost_bn = 0.0;
  double carbon_cost_bn = 0.0;
  double total_cost_bn = 0.0;
};

// Numeric columns in export order (Year is the row key, not a column here).
enum class Column : std::uint8_t {
  TotalDemand = 0,
  SafShare,
  SafVolume,
  ConventionalVolume,
  Co2Generated,
  Co2Avoided,
  CarbonPrice,
  FuelCost,
  CarbonCost,
  TotalCost,
  Count
};

inline constexpr std::size_t kColumnCount = static_cast<std::size_t>(Column::Count);
inline constexpr std::string_view kYearColumnName = "Year";

const std::array<Column, kColumnCount>& all_columns() noexcept;

std::string_view column_name(Column c) noexcept;

std::optional<Column> find_column(std::string_view name) noexcept;

double column_value(const ScenarioRow& r, Column c) noexcept;

class ScenarioResult {
 public:
  // kInternal unless rows cover the horizon in ascending order.
  ScenarioResult(ScenarioId scenario, std::vector<ScenarioRow> rows);

  ScenarioId scenario() const noexcept { return scenario_; }
  const std::vector<ScenarioRow>& rows() const noexcept { return rows_; }
  std::size_t size() const noexcept { return rows_.size(); }

  // kInvalidInput for a year outside the horizon.
  const ScenarioRow& at_year(int year) const;

  std::vector<double> column(Column c) const;

  // kInvalidInput for an unknown column name.
  std::vector<double> column(std::string_view name) const;

 private:
  ScenarioId scenario_;
  std::vector<ScenarioRow> rows_;
};

}  // namespace safcast
