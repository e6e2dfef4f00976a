#include "safcast/model/scenario.hpp"

#include <cctype>
#include <string>

#include "safcast/core/error.hpp"

namespace safcast {

namespace {

constexpr std::array<ScenarioDefinition, kScenarioCount> kCatalog{{
    {ScenarioId::S0, "S0", "Market-Driven", SharePolicy::Voluntary, false},
    {ScenarioId::S1, "S1", "Mandate", SharePolicy::Mandated, false},
    {ScenarioId::S2, "S2", "Accelerated Abatement", SharePolicy::Mandated, true},
}};

std::string_view trim(std::string_view v) {
  while (!v.empty() && std::isspace(static_cast<unsigned char>(v.front()))) v.remove_prefix(1);
  while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) v.remove_suffix(1);
  return v;
}

}  // namespace

const std::array<ScenarioId, kScenarioCount>& all_scenarios() noexcept {
  static const std::array<ScenarioId, kScenarioCount> ids{ScenarioId::S0, ScenarioId::S1, ScenarioId::S2};
  return ids;
}

bool is_known_scenario(ScenarioId id) noexcept {
  return static_cast<std::size_t>(id) < kCatalog.size();
}

const ScenarioDefinition& scenario_definition(ScenarioId id) {
  SAFCAST_ENSURE(is_known_scenario(id), ErrorCode::kUnknownScenario,
                 "scenario id " + std::to_string(static_cast<int>(id)) + " is not one of S0, S1, S2");
  return kCatalog[static_cast<std::size_t>(id)];
}

const char* to_string(ScenarioId id) noexcept {
  return is_known_scenario(id) ? kCatalog[static_cast<std::size_t>(id)].code : "S?";
}

std::optional<ScenarioId> try_parse_scenario_id(std::string_view token) noexcept {
  const std::string_view t = trim(token);
  if (t.size() != 2) return std::nullopt;
  if (t[0] != 'S' && t[0] != 's') return std::nullopt;
  for (const auto& def : kCatalog) {
    if (def.code[1] == t[1]) return def.id;
  }
  return std::nullopt;
}

ScenarioId parse_scenario_id(std::string_view token) {
  const auto id = try_parse_scenario_id(token);
  if (!id) {
    SAFCAST_THROW(ErrorCode::kUnknownScenario,
                  "unknown scenario '" + std::string(token) + "' (expected S0, S1 or S2)");
  }
  return *id;
}

}  // namespace safcast
