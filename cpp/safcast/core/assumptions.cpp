#include "safcast/core/assumptions.hpp"

namespace safcast {

MandateSchedule default_mandate_schedule() {
  MandateSchedule m;
  m.targets = {
      {2025, 0.02},
      {2030, 0.06},
      {2035, 0.20},
      {2040, 0.34},
      {2045, 0.42},
      {2050, 0.70},
  };
  m.boundary = BoundaryPolicy::HoldNearest;
  return m;
}

AssumptionSet default_assumptions() {
  AssumptionSet a;
  a.adoption.mandate = default_mandate_schedule();
  a.validate_or_throw();
  return a;
}

}  // namespace safcast
