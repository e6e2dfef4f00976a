#include "safcast/core/mandate_schedule.hpp"

#include <algorithm>
#include <string>

#include "safcast/core/error.hpp"

namespace safcast {

void MandateSchedule::validate_or_throw() const {
  validate_control_points(targets);
  for (const auto& t : targets) {
    SAFCAST_ENSURE(t.value >= 0.0 && t.value <= 1.0, ErrorCode::kInvalidConfig,
                   "MandateSchedule: share at " + std::to_string(t.year) + " must be in [0,1]");
  }
}

double MandateSchedule::share_at(int year) const {
  return std::clamp(interpolate_linear(targets, year, boundary), 0.0, 1.0);
}

YearArray MandateSchedule::shares() const {
  YearArray out = fill_horizon(targets, boundary);
  for (double& s : out) s = std::clamp(s, 0.0, 1.0);
  return out;
}

}  // namespace safcast
