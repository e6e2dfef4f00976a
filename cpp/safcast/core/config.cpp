#include "safcast/core/config.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>

#include "safcast/core/error.hpp"
#include "safcast/core/logging.hpp"

namespace safcast {

namespace {

std::string trim(std::string_view v) {
  std::size_t b = 0;
  std::size_t e = v.size();
  while (b < e && std::isspace(static_cast<unsigned char>(v[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(v[e - 1]))) --e;
  return std::string(v.substr(b, e - b));
}

std::string where(const std::string& origin, int line_no) {
  return origin + ":" + std::to_string(line_no);
}

double parse_number(const std::string& s, const std::string& at) {
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (s.empty() || end == s.c_str() || *end != '\0' || !std::isfinite(v)) {
    SAFCAST_THROW(ErrorCode::kParseError, at + ": expected a finite number, got '" + s + "'");
  }
  return v;
}

int parse_int(const std::string& s, const std::string& at) {
  const double v = parse_number(s, at);
  if (v != std::floor(v) || std::fabs(v) > 1.0e6) {
    SAFCAST_THROW(ErrorCode::kParseError, at + ": expected an integer, got '" + s + "'");
  }
  return static_cast<int>(v);
}

bool all_digits(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

// Shortest of 15/17 significant digits that reads back to the same double.
std::string format_double(double x) {
  for (int precision : {15, 17}) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << x;
    if (std::strtod(oss.str().c_str(), nullptr) == x || precision == 17) return oss.str();
  }
  return {};
}

}  // namespace

AssumptionSet parse_assumptions(std::string_view text,
                                const AssumptionSet& base,
                                const std::string& origin) {
  AssumptionSet a = base;

  std::map<int, double> mandate;
  bool mandate_overridden = false;

  int line_no = 0;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    const std::size_t nl = text.find('\n', pos);
    const std::string_view raw =
        text.substr(pos, (nl == std::string_view::npos) ? std::string_view::npos : nl - pos);
    pos = (nl == std::string_view::npos) ? text.size() + 1 : nl + 1;
    ++line_no;

    std::string_view body = raw;
    const std::size_t hash = body.find('#');
    if (hash != std::string_view::npos) body = body.substr(0, hash);
    const std::string line = trim(body);
    if (line.empty()) continue;

    const std::string at = where(origin, line_no);
    const std::size_t eq = line.find('=');
    if (eq == std::string::npos) {
      SAFCAST_THROW(ErrorCode::kParseError, at + ": expected 'key = value'");
    }
    const std::string key = trim(std::string_view(line).substr(0, eq));
    const std::string value = trim(std::string_view(line).substr(eq + 1));
    if (key.empty()) SAFCAST_THROW(ErrorCode::kParseError, at + ": empty key");

    if (key == "emission.conventional_t_per_t") {
      a.emissions.conventional_t_per_t = parse_number(value, at);
    } else if (key == "emission.saf_lifecycle_reduction") {
      a.emissions.saf_lifecycle_reduction = parse_number(value, at);
    } else if (key == "price.conventional_per_t") {
      a.prices.conventional_per_t = parse_number(value, at);
    } else if (key == "price.saf_premium") {
      a.prices.saf_premium = parse_number(value, at);
    } else if (key == "efficiency.tech_gain_per_year") {
      a.efficiency.tech_gain_per_year = parse_number(value, at);
    } else if (key == "efficiency.operational_max_gain") {
      a.efficiency.operational_max_gain = parse_number(value, at);
    } else if (key == "efficiency.operational_ramp_years") {
      a.efficiency.operational_ramp_years = parse_int(value, at);
    } else if (key == "carbon.base_price_per_t") {
      a.carbon.base_price_per_t = parse_number(value, at);
    } else if (key == "carbon.slope_per_year") {
      a.carbon.slope_per_year = parse_number(value, at);
    } else if (key == "adoption.voluntary_share") {
      a.adoption.voluntary_share = parse_number(value, at);
    } else if (key == "mandate.boundary") {
      if (value == "hold") {
        a.adoption.mandate.boundary = BoundaryPolicy::HoldNearest;
      } else if (value == "error") {
        a.adoption.mandate.boundary = BoundaryPolicy::Throw;
      } else {
        SAFCAST_THROW(ErrorCode::kParseError, at + ": mandate.boundary must be 'hold' or 'error'");
      }
    } else if (key.rfind("mandate.", 0) == 0 && all_digits(std::string_view(key).substr(8))) {
      const int year = parse_int(key.substr(8), at);
      mandate_overridden = true;
      if (!mandate.emplace(year, parse_number(value, at)).second) {
        SAFCAST_THROW(ErrorCode::kInvalidConfig, at + ": duplicate mandate year " + std::to_string(year));
      }
    } else {
      SAFCAST_THROW(ErrorCode::kInvalidConfig, at + ": unknown key '" + key + "'");
    }
  }

  if (mandate_overridden) {
    a.adoption.mandate.targets.clear();
    for (const auto& [year, share] : mandate) a.adoption.mandate.targets.push_back({year, share});
  }

  a.validate_or_throw();
  return a;
}

AssumptionSet load_assumptions_file(const std::string& path, const AssumptionSet& base) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    SAFCAST_THROW(ErrorCode::kIoError, "cannot open assumptions file '" + path + "'");
  }
  std::ostringstream buf;
  buf << ifs.rdbuf();
  if (ifs.bad()) {
    SAFCAST_THROW(ErrorCode::kIoError, "failed reading assumptions file '" + path + "'");
  }

  AssumptionSet a = parse_assumptions(buf.str(), base, path);
  log_info("loaded assumption overrides from " + path);
  return a;
}

std::string format_assumptions(const AssumptionSet& a) {
  std::ostringstream o;
  o << "emission.conventional_t_per_t = " << format_double(a.emissions.conventional_t_per_t) << "\n"
    << "emission.saf_lifecycle_reduction = " << format_double(a.emissions.saf_lifecycle_reduction) << "\n"
    << "price.conventional_per_t = " << format_double(a.prices.conventional_per_t) << "\n"
    << "price.saf_premium = " << format_double(a.prices.saf_premium) << "\n"
    << "efficiency.tech_gain_per_year = " << format_double(a.efficiency.tech_gain_per_year) << "\n"
    << "efficiency.operational_max_gain = " << format_double(a.efficiency.operational_max_gain) << "\n"
    << "efficiency.operational_ramp_years = " << a.efficiency.operational_ramp_years << "\n"
    << "carbon.base_price_per_t = " << format_double(a.carbon.base_price_per_t) << "\n"
    << "carbon.slope_per_year = " << format_double(a.carbon.slope_per_year) << "\n"
    << "adoption.voluntary_share = " << format_double(a.adoption.voluntary_share) << "\n"
    << "mandate.boundary = "
    << (a.adoption.mandate.boundary == BoundaryPolicy::Throw ? "error" : "hold") << "\n";
  for (const auto& t : a.adoption.mandate.targets) {
    o << "mandate." << t.year << " = " << format_double(t.value) << "\n";
  }
  return o.str();
}

}  // namespace safcast
