#include "safcast/model/fingerprint.hpp"

#include <string_view>

namespace safcast {
namespace {

void add_tag(Fnv1a64& h, std::string_view tag) {
  h.update_string(tag);
  h.update_u8(0x1F);
}

}  // namespace

Hash64 hash_assumptions(const AssumptionSet& a) {
  a.validate_or_throw();

  Fnv1a64 h;
  add_tag(h, "AssumptionSet/v1");

  add_tag(h, "Emissions");
  h.update_f64(a.emissions.conventional_t_per_t);
  h.update_f64(a.emissions.saf_lifecycle_reduction);

  add_tag(h, "Prices");
  h.update_f64(a.prices.conventional_per_t);
  h.update_f64(a.prices.saf_premium);

  add_tag(h, "Efficiency");
  h.update_f64(a.efficiency.tech_gain_per_year);
  h.update_f64(a.efficiency.operational_max_gain);
  h.update_i32(a.efficiency.operational_ramp_years);

  add_tag(h, "Carbon");
  h.update_f64(a.carbon.base_price_per_t);
  h.update_f64(a.carbon.slope_per_year);

  add_tag(h, "Adoption");
  h.update_f64(a.adoption.voluntary_share);
  h.update_enum(a.adoption.mandate.boundary);
  h.update_u64(static_cast<uint64_t>(a.adoption.mandate.targets.size()));
  for (const auto& t : a.adoption.mandate.targets) {
    h.update_i32(t.year);
    h.update_f64(t.value);
  }

  return Hash64{h.value()};
}

Hash64 hash_forecast_inputs(const ForecastInputs& in) {
  in.validate_or_throw();

  Fnv1a64 h;
  add_tag(h, "ForecastInputs/v1");
  h.update_f64(in.base_demand_mt);
  h.update_f64(in.annual_growth_rate);
  h.update_bool(in.apply_operational_gains);
  return Hash64{h.value()};
}

Hash64 hash_demand(const DemandSeries& d) {
  Fnv1a64 h;
  add_tag(h, "DemandSeries/v1");
  h.update_f64_array(d.values().data(), d.values().size());
  return Hash64{h.value()};
}

Hash64 hash_result(const ScenarioResult& r) {
  Fnv1a64 h;
  add_tag(h, "ScenarioResult/v1");
  h.update_enum(r.scenario());
  h.update_u64(static_cast<uint64_t>(r.size()));
  for (const auto& row : r.rows()) {
    h.update_i32(row.year);
    for (Column c : all_columns()) h.update_f64(column_value(row, c));
  }
  return Hash64{h.value()};
}

std::string RunKey::run_id() const {
  return std::string(to_string(scenario)) +
         "__a_" + hash_to_hex(assumptions_h) +
         "__f_" + hash_to_hex(forecast_h) +
         "__r_" + hash_to_hex(combined_h);
}

RunKey make_run_key(const AssumptionSet& a, const ForecastInputs& in, ScenarioId id) {
  RunKey k;
  k.assumptions_h = hash_assumptions(a);
  k.forecast_h = hash_forecast_inputs(in);
  k.scenario = scenario_definition(id).id;

  Fnv1a64 s;
  s.update_enum(k.scenario);
  k.combined_h = hash_combine(hash_combine(k.assumptions_h, k.forecast_h), Hash64{s.value()});
  return k;
}

}  // namespace safcast
