/*
  Interpolation + Mandate Schedule Selftest

  Checks
  ------
    1) Control-point years return the control value exactly.
    2) Linear between control points.
    3) HoldNearest extends flat; Throw rejects out-of-range years.
    4) Invalid control point sets are rejected (kInvalidConfig).
    5) Mandate shares stay inside [0,1] over the whole horizon.

  Framework-free; non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string_view>
#include <vector>

#include "safcast/core/assumptions.hpp"
#include "safcast/core/error.hpp"
#include "safcast/core/interpolation.hpp"
#include "safcast/core/mandate_schedule.hpp"

namespace safcast {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  got: " << a << "  expected: " << b << "\n";
  } else {
    pass(msg);
  }
}

template <class Fn>
void expect_error(Fn&& fn, ErrorCode expected, std::string_view msg) {
  try {
    fn();
    fail(msg);
    std::cerr << "  no exception thrown\n";
  } catch (const Error& e) {
    if (e.code() != expected) {
      fail(msg);
      std::cerr << "  wrong code: " << to_string(e.code()) << "\n";
    } else {
      pass(msg);
    }
  }
}

void test_exact_at_control_points() {
  const std::vector<ControlPoint> pts = {{2025, 0.02}, {2030, 0.06}, {2035, 0.20}};
  // Exact equality on purpose: no interpolation arithmetic at control years.
  expect_true(interpolate_linear(pts, 2025) == 0.02, "2025 returns its control value exactly");
  expect_true(interpolate_linear(pts, 2030) == 0.06, "2030 returns its control value exactly");
  expect_true(interpolate_linear(pts, 2035) == 0.20, "2035 returns its control value exactly");
}

void test_linear_between_points() {
  const std::vector<ControlPoint> pts = {{2025, 0.02}, {2030, 0.06}};
  expect_near(interpolate_linear(pts, 2026), 0.028, 1e-12, "2026 one fifth of the way");
  expect_near(interpolate_linear(pts, 2028), 0.044, 1e-12, "2028 three fifths of the way");

  const YearArray filled = fill_horizon(pts);
  expect_near(filled[1], 0.028, 1e-12, "fill_horizon matches interpolate_linear");
}

void test_boundary_policies() {
  const std::vector<ControlPoint> pts = {{2030, 0.10}, {2040, 0.30}};
  expect_true(interpolate_linear(pts, 2025, BoundaryPolicy::HoldNearest) == 0.10,
              "HoldNearest holds the first value before the range");
  expect_true(interpolate_linear(pts, 2050, BoundaryPolicy::HoldNearest) == 0.30,
              "HoldNearest holds the last value after the range");

  expect_error([&] { (void)interpolate_linear(pts, 2025, BoundaryPolicy::Throw); },
               ErrorCode::kInvalidInput, "Throw rejects a year before the range");
  expect_error([&] { (void)fill_horizon(pts, BoundaryPolicy::Throw); },
               ErrorCode::kInvalidInput, "Throw rejects filling a horizon the points do not cover");
}

void test_invalid_points() {
  expect_error([] { validate_control_points({}); }, ErrorCode::kInvalidConfig, "empty control points rejected");
  expect_error([] { validate_control_points({{2030, 0.1}, {2025, 0.2}}); }, ErrorCode::kInvalidConfig,
               "unsorted control points rejected");
  expect_error([] { validate_control_points({{2030, 0.1}, {2030, 0.2}}); }, ErrorCode::kInvalidConfig,
               "duplicate control year rejected");
  expect_error([] { validate_control_points({{2030, std::numeric_limits<double>::quiet_NaN()}}); },
               ErrorCode::kInvalidConfig, "NaN control value rejected");
}

void test_mandate_schedule() {
  const MandateSchedule m = default_mandate_schedule();
  m.validate_or_throw();
  pass("default mandate schedule validates");

  const YearArray s = m.shares();
  bool in_range = true;
  bool monotone = true;
  for (std::size_t i = 0; i < s.size(); ++i) {
    in_range = in_range && s[i] >= 0.0 && s[i] <= 1.0;
    if (i > 0) monotone = monotone && s[i] >= s[i - 1];
  }
  expect_true(in_range, "mandate shares within [0,1]");
  expect_true(monotone, "default mandate ramp never decreases");
  expect_true(m.share_at(2050) == 0.70, "2050 mandate is 70%");

  MandateSchedule bad = m;
  bad.targets.push_back({2055, 1.5});
  expect_error([&] { bad.validate_or_throw(); }, ErrorCode::kInvalidConfig, "target above 1 rejected");
}

}  // namespace
}  // namespace safcast

int main() {
  using namespace safcast;

  test_exact_at_control_points();
  test_linear_between_points();
  test_boundary_policies();
  test_invalid_points();
  test_mandate_schedule();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
