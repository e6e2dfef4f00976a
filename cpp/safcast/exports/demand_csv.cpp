#include "safcast/exports/demand_csv.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

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

// Minimal CSV splitter with quote handling (no escapes besides "").
std::vector<std::string> split_csv_row(const std::string& line, char delim) {
  std::vector<std::string> out;
  std::string cur;
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        cur.push_back('"');
        ++i;
      } else if (c == '"') {
        in_quotes = false;
      } else {
        cur.push_back(c);
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == delim) {
      out.push_back(cur);
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  out.push_back(cur);
  return out;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool try_parse_double(const std::string& s, double& out) {
  const std::string t = trim(s);
  if (t.empty()) return false;
  char* end = nullptr;
  out = std::strtod(t.c_str(), &end);
  if (end == t.c_str() || *end != '\0') return false;
  return std::isfinite(out);
}

bool try_parse_year(const std::string& s, int& out) {
  double v = 0.0;
  if (!try_parse_double(s, v) || v != std::floor(v) || std::fabs(v) > 1.0e6) return false;
  out = static_cast<int>(v);
  return true;
}

}  // namespace

std::string forecast_to_csv(const ForecastBreakdown& f, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  const int p = opt.precision;
  std::ostringstream out;
  if (opt.include_header) {
    out << "Year" << d << "Raw_Demand_Mt" << d << "Tech_Efficiency_Factor" << d
        << "Demand_After_Tech_Gains_Mt" << d << "Operational_Efficiency_Factor" << d
        << "Total_Fuel_Demand_Mt" << "\n";
  }
  for (const auto& r : f.rows) {
    out << r.year << d
        << csv_double(r.raw_demand_mt, p) << d
        << csv_double(r.tech_efficiency_factor, p) << d
        << csv_double(r.demand_after_tech_mt, p) << d
        << csv_double(r.operational_efficiency_factor, p) << d
        << csv_double(r.total_demand_mt, p) << "\n";
  }
  return out.str();
}

bool write_forecast_csv_file(const ForecastBreakdown& f, const std::string& file_path, const CsvExportOptions& opt) {
  return write_text_file(forecast_to_csv(f, opt), file_path);
}

DemandSeries parse_demand_csv(const std::string& csv_text, const std::string& origin) {
  std::istringstream iss(csv_text);
  std::string line;
  int line_no = 0;

  // Header: first non-blank line.
  std::vector<std::string> header;
  while (std::getline(iss, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;
    header = split_csv_row(line, ',');
    break;
  }
  SAFCAST_ENSURE(!header.empty(), ErrorCode::kParseError, origin + ": no header row");

  std::unordered_map<std::string, std::size_t> col;
  for (std::size_t i = 0; i < header.size(); ++i) col[lower(trim(header[i]))] = i;

  auto idx = [&](const char* name) -> std::optional<std::size_t> {
    auto it = col.find(name);
    if (it == col.end()) return std::nullopt;
    return it->second;
  };
  const auto idx_year = idx("year");
  const auto idx_demand = idx("total_fuel_demand_mt");
  SAFCAST_ENSURE(idx_year.has_value(), ErrorCode::kParseError, origin + ": missing 'Year' column");
  SAFCAST_ENSURE(idx_demand.has_value(), ErrorCode::kParseError,
                 origin + ": missing 'Total_Fuel_Demand_Mt' column");

  std::vector<std::pair<int, double>> rows;
  while (std::getline(iss, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;

    const auto fields = split_csv_row(line, ',');
    const std::string at = origin + ":" + std::to_string(line_no);
    SAFCAST_ENSURE(*idx_year < fields.size() && *idx_demand < fields.size(), ErrorCode::kParseError,
                   at + ": too few fields");

    int year = 0;
    double demand = 0.0;
    SAFCAST_ENSURE(try_parse_year(fields[*idx_year], year), ErrorCode::kParseError,
                   at + ": invalid year '" + fields[*idx_year] + "'");
    SAFCAST_ENSURE(try_parse_double(fields[*idx_demand], demand), ErrorCode::kParseError,
                   at + ": invalid demand '" + fields[*idx_demand] + "'");
    rows.emplace_back(year, demand);
  }

  return DemandSeries::from_year_values(rows);
}

DemandSeries load_demand_csv_file(const std::string& file_path) {
  std::ifstream ifs(file_path);
  if (!ifs.is_open()) {
    SAFCAST_THROW(ErrorCode::kIoError, "cannot open demand file '" + file_path + "'");
  }
  std::ostringstream buf;
  buf << ifs.rdbuf();
  if (ifs.bad()) {
    SAFCAST_THROW(ErrorCode::kIoError, "failed reading demand file '" + file_path + "'");
  }
  DemandSeries d = parse_demand_csv(buf.str(), file_path);
  log_info("loaded demand series from " + file_path);
  return d;
}

}  // namespace safcast
