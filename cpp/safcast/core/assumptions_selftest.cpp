/*
  Assumption Set + Overrides File Selftest

  Checks
  ------
    1) Defaults match the published model constants.
    2) Carbon price schedule is linear from the horizon start.
    3) Override files apply, replace the mandate ramp, and round-trip through
       format_assumptions().
    4) Malformed overrides fail with the documented error code.
    5) Any field change changes the assumptions fingerprint.

  Framework-free; non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

#include "safcast/core/assumptions.hpp"
#include "safcast/core/config.hpp"
#include "safcast/core/error.hpp"
#include "safcast/core/hashing.hpp"
#include "safcast/model/fingerprint.hpp"

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

void expect_config_error(std::string_view text, ErrorCode expected, std::string_view msg) {
  try {
    (void)parse_assumptions(text, default_assumptions());
    fail(msg);
    std::cerr << "  accepted: " << text << "\n";
  } catch (const Error& e) {
    if (e.code() != expected) {
      fail(msg);
      std::cerr << "  wrong code: " << to_string(e.code()) << " (" << e.message() << ")\n";
    } else {
      pass(msg);
    }
  }
}

void test_defaults() {
  const AssumptionSet a = default_assumptions();
  expect_near(a.emissions.conventional_t_per_t, 3.16, 0.0, "conventional emission factor 3.16");
  expect_near(a.emissions.saf_t_per_t(), 0.632, 1e-12, "SAF emission factor 0.632");
  expect_near(a.prices.conventional_per_t, 1000.0, 0.0, "conventional price 1000/t");
  expect_near(a.prices.saf_per_t(), 2500.0, 1e-9, "SAF price 2500/t");
  expect_near(a.efficiency.tech_gain_per_year, 0.015, 0.0, "tech gain 1.5%/yr");
  expect_near(a.efficiency.operational_max_gain, 0.07, 0.0, "operational gain capped at 7%");
  expect_true(a.efficiency.operational_ramp_years == 15, "operational ramp over 15 years");
  expect_near(a.adoption.voluntary_share, 0.01, 0.0, "voluntary share 1%");
  expect_true(a.adoption.mandate.targets.size() == 6, "six mandate control points");
  expect_true(a.adoption.mandate.boundary == BoundaryPolicy::HoldNearest, "mandate holds at the boundaries");
}

void test_carbon_price() {
  const CarbonPriceSchedule c = default_assumptions().carbon;
  expect_near(c.price_at(2025), 80.0, 1e-12, "carbon price 80 in 2025");
  expect_near(c.price_at(2026), 82.8, 1e-12, "carbon price 82.8 in 2026");
  expect_near(c.price_at(2050), 150.0, 1e-9, "carbon price 150 in 2050");
}

void test_overrides_apply() {
  const std::string text =
      "# tighter lifecycle reduction\n"
      "emission.saf_lifecycle_reduction = 0.65\n"
      "\n"
      "price.saf_premium=3   # inline comment\n"
      "mandate.2025 = 0.05\n"
      "mandate.2050 = 0.85\n"
      "mandate.boundary = error\n";
  const AssumptionSet a = parse_assumptions(text, default_assumptions());

  expect_near(a.emissions.saf_lifecycle_reduction, 0.65, 0.0, "lifecycle reduction overridden");
  expect_near(a.prices.saf_premium, 3.0, 0.0, "premium overridden");
  expect_near(a.prices.conventional_per_t, 1000.0, 0.0, "untouched keys keep their base value");
  expect_true(a.adoption.mandate.targets.size() == 2, "mandate keys replace the default ramp");
  expect_true(a.adoption.mandate.boundary == BoundaryPolicy::Throw, "boundary set to error");
  expect_near(a.adoption.mandate.share_at(2030), 0.05 + (0.85 - 0.05) * 0.2, 1e-12,
              "replacement ramp interpolates");

  const AssumptionSet back = parse_assumptions(format_assumptions(a), default_assumptions());
  expect_true(hash_assumptions(back) == hash_assumptions(a), "format_assumptions round-trips");
}

void test_override_errors() {
  expect_config_error("no equals sign here\n", ErrorCode::kParseError, "line without '=' rejected");
  expect_config_error("price.saf_premium = lots\n", ErrorCode::kParseError, "non-numeric value rejected");
  expect_config_error("efficiency.operational_ramp_years = 7.5\n", ErrorCode::kParseError,
                      "fractional ramp years rejected");
  expect_config_error("mandate.boundary = clamp\n", ErrorCode::kParseError, "unknown boundary policy rejected");
  expect_config_error("price.jet_a = 900\n", ErrorCode::kInvalidConfig, "unknown key rejected");
  expect_config_error("mandate.2030 = 0.1\nmandate.2030 = 0.2\n", ErrorCode::kInvalidConfig,
                      "duplicate mandate year rejected");
  expect_config_error("mandate.2030 = 1.2\n", ErrorCode::kInvalidConfig, "mandate above 100% rejected");
  expect_config_error("adoption.voluntary_share = -0.1\n", ErrorCode::kInvalidConfig,
                      "negative voluntary share rejected");
  expect_config_error("carbon.base_price_per_t = 10\ncarbon.slope_per_year = -5\n", ErrorCode::kInvalidConfig,
                      "carbon price going negative rejected");

  try {
    (void)load_assumptions_file("/nonexistent/safcast/overrides.cfg", default_assumptions());
    fail("missing overrides file must throw");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kIoError, "missing overrides file is kIoError");
  }
}

void test_fingerprint_sensitivity() {
  const AssumptionSet base = default_assumptions();
  const Hash64 h0 = hash_assumptions(base);
  expect_true(h0 == hash_assumptions(default_assumptions()), "assumptions hash is deterministic");
  expect_true(hash_to_hex(h0).size() == 16, "hash hex is 16 digits");

  AssumptionSet a = base;
  a.carbon.slope_per_year = 2.9;
  expect_true(hash_assumptions(a) != h0, "carbon slope changes the hash");

  a = base;
  a.adoption.mandate.targets.back().value = 0.71;
  expect_true(hash_assumptions(a) != h0, "mandate target changes the hash");

  a = base;
  a.adoption.mandate.boundary = BoundaryPolicy::Throw;
  expect_true(hash_assumptions(a) != h0, "boundary policy changes the hash");
}

}  // namespace
}  // namespace safcast

int main() {
  using namespace safcast;

  test_defaults();
  test_carbon_price();
  test_overrides_apply();
  test_override_errors();
  test_fingerprint_sensitivity();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
