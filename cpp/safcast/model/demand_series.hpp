#pragma once
/*
================================================================================
Fragment 2.1 - Model: Demand Series
FILE: cpp/safcast/model/demand_series.hpp

Purpose:
  - Immutable yearly fuel demand (Mt) over the fixed horizon.

Invariants (checked at construction, kMalformedSeries otherwise):
  - Exactly one value per horizon year.
  - Every value finite and >= 0.
================================================================================
*/

#include <cstddef>
#include <utility>
#include <vector>

#include "safcast/core/horizon.hpp"

namespace safcast {

class DemandSeries {
 public:
  explicit DemandSeries(const YearArray& total_demand_mt);

  // Build from (year, Mt) rows in any order, e.g. read from a CSV file.
  // Missing, duplicated or out-of-horizon years are kMalformedSeries.
  static DemandSeries from_year_values(const std::vector<std::pair<int, double>>& rows);

  // kInvalidInput for a year outside the horizon.
  double at_year(int year) const;

  double operator[](std::size_t i) const noexcept { return values_[i]; }
  const YearArray& values() const noexcept { return values_; }
  constexpr std::size_t size() const noexcept { return horizon::kYears; }

 private:
  YearArray values_;
};

}  // namespace safcast
