#pragma once
/*
================================================================================
Fragment 1.4 - Core: Units + Reporting Scales
FILE: cpp/safcast/core/units.hpp

Purpose:
  - Keep the scale factors used by the emission/cost formulas in one place.

Conventions:
  - Fuel volumes and CO2 masses are carried in Mt throughout.
  - Prices are per tonne; monetary outputs are reported in billions.
  - Blending share is a fraction internally and a percentage in result tables.
================================================================================
*/

namespace safcast::units {

inline constexpr double kBillion = 1.0e9;
inline constexpr double kPercentPerFraction = 100.0;

constexpr double to_billions(double amount) { return amount / kBillion; }
constexpr double fraction_to_percent(double f) { return f * kPercentPerFraction; }

} // namespace safcast::units
