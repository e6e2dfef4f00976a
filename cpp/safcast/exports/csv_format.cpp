#include "safcast/exports/csv_format.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <initializer_list>
#include <sstream>

#include "safcast/core/logging.hpp"

namespace safcast {

std::string csv_escape(const std::string& s, char delim) {
  bool needs_quote = false;
  for (char c : s) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }
  if (!needs_quote) return s;

  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  if (precision > 0) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << x;
    return oss.str();
  }
  std::string out;
  for (int p : {15, 17}) {
    std::ostringstream oss;
    oss << std::setprecision(p) << x;
    out = oss.str();
    if (std::strtod(out.c_str(), nullptr) == x) break;
  }
  return out;
}

bool write_text_file(const std::string& text, const std::string& file_path) {
  std::ofstream ofs(file_path);
  if (!ofs.is_open()) {
    log_error("cannot open '" + file_path + "' for writing");
    return false;
  }
  ofs << text;
  ofs.flush();
  if (!ofs.good()) {
    log_error("write failed for '" + file_path + "'");
    return false;
  }
  log_debug("wrote " + file_path);
  return true;
}

}  // namespace safcast
