#pragma once
/*
================================================================================
Fragment 1.5 - Core: Piecewise-Linear Control-Point Interpolation
FILE: cpp/safcast/core/interpolation.hpp

Purpose:
  - Fill a yearly axis from a sparse, sorted set of (year, value) control points.
  - Shared by every schedule that ramps between policy targets.

Contract:
  - Control points: non-empty, strictly increasing years, finite values.
  - At a control-point year the control value is returned exactly.
  - Between two control points: linear in the year.
  - Outside [first.year, last.year]: governed by BoundaryPolicy.
================================================================================
*/

#include <cstdint>
#include <vector>

#include "safcast/core/horizon.hpp"

namespace safcast {

struct ControlPoint {
  int year = 0;
  double value = 0.0;
};

enum class BoundaryPolicy : std::uint8_t {
  HoldNearest = 0,  // flat extension with the nearest boundary value
  Throw = 1         // kInvalidInput for years outside the defined range
};

// Throws kInvalidConfig if the points violate the contract above.
void validate_control_points(const std::vector<ControlPoint>& points);

// Value at `year`. Points must already be valid.
double interpolate_linear(const std::vector<ControlPoint>& points,
                          int year,
                          BoundaryPolicy policy = BoundaryPolicy::HoldNearest);

// Value for every horizon year.
YearArray fill_horizon(const std::vector<ControlPoint>& points,
                       BoundaryPolicy policy = BoundaryPolicy::HoldNearest);

}  // namespace safcast
