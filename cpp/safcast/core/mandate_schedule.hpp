#pragma once
/*
================================================================================
Fragment 1.6 - Core: SAF Mandate Schedule
FILE: cpp/safcast/core/mandate_schedule.hpp

Sparse blending-share targets (fractions in [0,1]) keyed by year. Years between
targets are linearly interpolated; resolved shares are clamped to [0,1].
================================================================================
*/

#include <vector>

#include "safcast/core/horizon.hpp"
#include "safcast/core/interpolation.hpp"

namespace safcast {

struct MandateSchedule {
  std::vector<ControlPoint> targets;
  BoundaryPolicy boundary = BoundaryPolicy::HoldNearest;

  // Throws kInvalidConfig: empty, unsorted, or a target outside [0,1].
  void validate_or_throw() const;

  // Share (fraction) for one year.
  double share_at(int year) const;

  // Share (fraction) for every horizon year.
  YearArray shares() const;
};

}  // namespace safcast
