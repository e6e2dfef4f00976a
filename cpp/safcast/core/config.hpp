#pragma once
/*
================================================================================
Fragment 1.9 - Core: Assumption Overrides File
FILE: cpp/safcast/core/config.hpp

Purpose:
  - Let a study override individual AssumptionSet fields without recompiling.

Format (one override per line):
    # comment
    emission.conventional_t_per_t = 3.16
    emission.saf_lifecycle_reduction = 0.80
    price.conventional_per_t = 1000
    price.saf_premium = 2.5
    efficiency.tech_gain_per_year = 0.015
    efficiency.operational_max_gain = 0.07
    efficiency.operational_ramp_years = 15
    carbon.base_price_per_t = 80
    carbon.slope_per_year = 2.8
    adoption.voluntary_share = 0.01
    mandate.2030 = 0.06          # first mandate.<year> replaces the default ramp
    mandate.boundary = hold      # hold | error

Errors:
  - kParseError    : malformed line or value
  - kInvalidConfig : unknown key, duplicate mandate year, or the resulting set
                     fails validate_or_throw()
  - kIoError       : file cannot be read
================================================================================
*/

#include <string>
#include <string_view>

#include "safcast/core/assumptions.hpp"

namespace safcast {

// Apply the overrides in `text` on top of `base`. `origin` names the source in
// error messages (file path or "<text>").
AssumptionSet parse_assumptions(std::string_view text,
                                const AssumptionSet& base,
                                const std::string& origin = "<text>");

AssumptionSet load_assumptions_file(const std::string& path,
                                    const AssumptionSet& base);

// Every field in the override format above (round-trips through parse_assumptions).
std::string format_assumptions(const AssumptionSet& a);

}  // namespace safcast
