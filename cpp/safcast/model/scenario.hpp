#pragma once
/*
================================================================================
Fragment 2.3 - Model: Policy Scenarios
FILE: cpp/safcast/model/scenario.hpp

Closed set of SAF adoption policies:
  S0  Market-Driven          constant voluntary share
  S1  Mandate                interpolated mandate schedule
  S2  Accelerated Abatement  mandate schedule, evaluated on the demand forecast
                             with operational efficiency gains

Anything outside this set is rejected with kUnknownScenario at the boundary.
================================================================================
*/

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace safcast {

enum class ScenarioId : std::uint8_t { S0 = 0, S1 = 1, S2 = 2 };

enum class SharePolicy : std::uint8_t {
  Voluntary = 0,  // AdoptionSettings::voluntary_share every year
  Mandated = 1    // AdoptionSettings::mandate
};

struct ScenarioDefinition {
  ScenarioId id;
  const char* code;
  const char* title;
  SharePolicy share_policy;
  // Demand forecast the standard study pairs with this scenario.
  bool operational_gains;
};

inline constexpr std::size_t kScenarioCount = 3;

const std::array<ScenarioId, kScenarioCount>& all_scenarios() noexcept;

bool is_known_scenario(ScenarioId id) noexcept;

// kUnknownScenario for a value outside the enumeration.
const ScenarioDefinition& scenario_definition(ScenarioId id);

// "S0" / "S1" / "S2"; "S?" for a value outside the enumeration.
const char* to_string(ScenarioId id) noexcept;

// Case-insensitive, surrounding whitespace ignored.
std::optional<ScenarioId> try_parse_scenario_id(std::string_view token) noexcept;

// kUnknownScenario if the token names no scenario.
ScenarioId parse_scenario_id(std::string_view token);

}  // namespace safcast
