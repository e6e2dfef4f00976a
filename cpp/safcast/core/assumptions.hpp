#pragma once
/*
================================================================================
Fragment 1.7 - Core: Model Assumptions (AssumptionSet)
FILE: cpp/safcast/core/assumptions.hpp

Purpose:
  - Centralize every model constant (emission factors, fuel prices, efficiency
    trends, carbon price schedule, adoption targets) in one validated value.
  - Scenario comparisons are only fair if every run reads the same table, so
    the set is built once, validated, and passed by const& everywhere.
    hash_assumptions() (model/fingerprint) identifies it in logs and exports.

Defaults:
  - Conventional jet fuel: 3.16 tCO2/t, 1000 per t.
  - SAF: 80% lifecycle reduction (0.632 tCO2/t), 2.5x price premium.
  - Aircraft technology: 1.5%/yr fuel-burn reduction.
  - Operational (ATM) efficiency: up to 7%, reached linearly over 15 years.
  - Carbon price: 80 per tCO2 in 2025, +2.8 per year.
  - Market-driven voluntary SAF share 1%; mandate ramp 2% (2025) to 70% (2050).

Hardening:
  - validate_or_throw() rejects nonsensical values (kInvalidConfig) before any
    calculation runs.
================================================================================
*/

#include "safcast/core/error.hpp"
#include "safcast/core/horizon.hpp"
#include "safcast/core/mandate_schedule.hpp"

namespace safcast {

// ----------------------------- Emissions -------------------------------------
struct EmissionFactors {
  // tCO2 per tonne of conventional jet fuel.
  double conventional_t_per_t = 3.16;

  // Fractional lifecycle-emission cut of SAF relative to conventional fuel.
  double saf_lifecycle_reduction = 0.80;

  double saf_t_per_t() const {
    return conventional_t_per_t * (1.0 - saf_lifecycle_reduction);
  }

  void validate_or_throw() const {
    SAFCAST_ENSURE(conventional_t_per_t > 0.0 && conventional_t_per_t <= 10.0, ErrorCode::kInvalidConfig,
                   "EmissionFactors: conventional_t_per_t outside sane bounds (0,10]");
    SAFCAST_ENSURE(saf_lifecycle_reduction >= 0.0 && saf_lifecycle_reduction <= 1.0, ErrorCode::kInvalidConfig,
                   "EmissionFactors: saf_lifecycle_reduction must be in [0,1]");
  }
};

// ----------------------------- Fuel prices -----------------------------------
struct FuelPrices {
  // Currency per tonne.
  double conventional_per_t = 1000.0;

  // SAF price as a multiple of the conventional price.
  double saf_premium = 2.5;

  double saf_per_t() const { return conventional_per_t * saf_premium; }

  void validate_or_throw() const {
    SAFCAST_ENSURE(conventional_per_t >= 0.0 && conventional_per_t <= 1.0e5, ErrorCode::kInvalidConfig,
                   "FuelPrices: conventional_per_t outside sane bounds [0,1e5]");
    SAFCAST_ENSURE(saf_premium >= 0.0 && saf_premium <= 20.0, ErrorCode::kInvalidConfig,
                   "FuelPrices: saf_premium outside sane bounds [0,20]");
  }
};

// ----------------------------- Efficiency ------------------------------------
struct EfficiencySettings {
  // Annual fuel-burn reduction from fleet renewal, always applied.
  double tech_gain_per_year = 0.015;

  // Total operational gain available (air-traffic-management programs).
  double operational_max_gain = 0.07;

  // Years after the horizon start at which the full operational gain is reached.
  int operational_ramp_years = 15;

  void validate_or_throw() const {
    SAFCAST_ENSURE(tech_gain_per_year >= 0.0 && tech_gain_per_year < 0.5, ErrorCode::kInvalidConfig,
                   "EfficiencySettings: tech_gain_per_year must be in [0,0.5)");
    SAFCAST_ENSURE(operational_max_gain >= 0.0 && operational_max_gain < 1.0, ErrorCode::kInvalidConfig,
                   "EfficiencySettings: operational_max_gain must be in [0,1)");
    SAFCAST_ENSURE(operational_ramp_years >= 1 && operational_ramp_years <= 100, ErrorCode::kInvalidConfig,
                   "EfficiencySettings: operational_ramp_years must be in [1,100]");
  }
};

// ----------------------------- Carbon price ----------------------------------
// price(year) = base + slope * (year - horizon start)
struct CarbonPriceSchedule {
  double base_price_per_t = 80.0;
  double slope_per_year = 2.8;

  double price_at(int year) const {
    return base_price_per_t + slope_per_year * static_cast<double>(year - horizon::kStartYear);
  }

  void validate_or_throw() const {
    SAFCAST_ENSURE(base_price_per_t >= 0.0 && base_price_per_t <= 1.0e4, ErrorCode::kInvalidConfig,
                   "CarbonPriceSchedule: base_price_per_t outside sane bounds [0,1e4]");
    SAFCAST_ENSURE(slope_per_year > -1.0e3 && slope_per_year < 1.0e3, ErrorCode::kInvalidConfig,
                   "CarbonPriceSchedule: slope_per_year outside sane bounds");
    // A negative slope must not push the price below zero inside the horizon.
    SAFCAST_ENSURE(price_at(horizon::kEndYear) >= 0.0, ErrorCode::kInvalidConfig,
                   "CarbonPriceSchedule: price becomes negative before the horizon end");
  }
};

// ----------------------------- Adoption --------------------------------------
struct AdoptionSettings {
  // Market-driven (no mandate) SAF share, constant over the horizon.
  double voluntary_share = 0.01;

  // Mandated SAF shares.
  MandateSchedule mandate;

  void validate_or_throw() const {
    SAFCAST_ENSURE(voluntary_share >= 0.0 && voluntary_share <= 1.0, ErrorCode::kInvalidConfig,
                   "AdoptionSettings: voluntary_share must be in [0,1]");
    mandate.validate_or_throw();
  }
};

// ----------------------------- AssumptionSet ---------------------------------
struct AssumptionSet {
  EmissionFactors emissions;
  FuelPrices prices;
  EfficiencySettings efficiency;
  CarbonPriceSchedule carbon;
  AdoptionSettings adoption;

  void validate_or_throw() const {
    emissions.validate_or_throw();
    prices.validate_or_throw();
    efficiency.validate_or_throw();
    carbon.validate_or_throw();
    adoption.validate_or_throw();
  }
};

// Default mandate ramp: 2% (2025), 6% (2030), 20% (2035), 34% (2040), 42% (2045), 70% (2050).
MandateSchedule default_mandate_schedule();

// Defaults listed above, already validated.
AssumptionSet default_assumptions();

}  // namespace safcast
