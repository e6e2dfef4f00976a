#include "safcast/core/interpolation.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "safcast/core/error.hpp"

namespace safcast {

void validate_control_points(const std::vector<ControlPoint>& points) {
  SAFCAST_ENSURE(!points.empty(), ErrorCode::kInvalidConfig, "control points: empty");
  for (std::size_t i = 0; i < points.size(); ++i) {
    SAFCAST_ENSURE(std::isfinite(points[i].value), ErrorCode::kInvalidConfig,
                   "control points: non-finite value at year " + std::to_string(points[i].year));
    if (i > 0) {
      SAFCAST_ENSURE(points[i].year > points[i - 1].year, ErrorCode::kInvalidConfig,
                     "control points: years must be strictly increasing (at " +
                         std::to_string(points[i].year) + ")");
    }
  }
}

double interpolate_linear(const std::vector<ControlPoint>& points, int year, BoundaryPolicy policy) {
  SAFCAST_ENSURE(!points.empty(), ErrorCode::kInvalidConfig, "interpolate_linear: no control points");

  const ControlPoint& first = points.front();
  const ControlPoint& last = points.back();

  if (year <= first.year || year >= last.year) {
    if (year == first.year) return first.value;
    if (year == last.year) return last.value;
    if (policy == BoundaryPolicy::Throw) {
      SAFCAST_THROW(ErrorCode::kInvalidInput,
                    "interpolate_linear: year " + std::to_string(year) + " outside control range [" +
                        std::to_string(first.year) + ", " + std::to_string(last.year) + "]");
    }
    return (year < first.year) ? first.value : last.value;
  }

  // First control point with year >= `year`; guaranteed interior here.
  const auto hi = std::lower_bound(points.begin(), points.end(), year,
                                   [](const ControlPoint& p, int y) { return p.year < y; });
  if (hi->year == year) return hi->value;

  const auto lo = hi - 1;
  const double t = static_cast<double>(year - lo->year) / static_cast<double>(hi->year - lo->year);
  return lo->value + (hi->value - lo->value) * t;
}

YearArray fill_horizon(const std::vector<ControlPoint>& points, BoundaryPolicy policy) {
  YearArray out{};
  for (std::size_t i = 0; i < horizon::kYears; ++i) {
    out[i] = interpolate_linear(points, horizon::year_at(i), policy);
  }
  return out;
}

}  // namespace safcast
