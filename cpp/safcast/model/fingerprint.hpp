#pragma once
/*
================================================================================
Fragment 2.6 - Model: Run Fingerprints
FILE: cpp/safcast/model/fingerprint.hpp

Purpose:
  - Reproducible identities for the three things that fully determine a result:
      * the AssumptionSet
      * the forecast inputs
      * the scenario id
    plus a hash of the result table itself (bit-exact determinism checks).
  - RunKey::run_id() gives a stable string for artifact file names.

Hardening:
  - Fields hashed in a fixed order, each section tagged.
  - Floats via canonical bit patterns (Fnv1a64::update_f64).
================================================================================
*/

#include <string>

#include "safcast/core/assumptions.hpp"
#include "safcast/core/hashing.hpp"
#include "safcast/model/demand_series.hpp"
#include "safcast/model/forecast.hpp"
#include "safcast/model/scenario.hpp"
#include "safcast/model/scenario_result.hpp"

namespace safcast {

struct RunKey {
  Hash64 assumptions_h{};
  Hash64 forecast_h{};
  ScenarioId scenario = ScenarioId::S0;
  Hash64 combined_h{};

  // Format: <scenario>__a_<16>__f_<16>__r_<16>
  std::string run_id() const;
};

Hash64 hash_assumptions(const AssumptionSet& a);
Hash64 hash_forecast_inputs(const ForecastInputs& in);
Hash64 hash_demand(const DemandSeries& d);
Hash64 hash_result(const ScenarioResult& r);

RunKey make_run_key(const AssumptionSet& a, const ForecastInputs& in, ScenarioId id);

}  // namespace safcast
