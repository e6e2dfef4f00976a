#pragma once
/*
================================================================================
Fragment 3.0 - Exports: Shared CSV Formatting
FILE: cpp/safcast/exports/csv_format.hpp

Numeric cells:
  - precision <= 0: shortest of 15/17 significant digits that reads back to
    the same double (default; cost columns are ~1e-5 bn and must not lose
    digits).
  - precision  > 0: that many significant digits.
  - NaN/Inf export as an empty cell.
================================================================================
*/

#include <string>

namespace safcast {

struct CsvExportOptions {
  bool include_header = true;
  char delimiter = ',';
  int precision = 0;  // significant digits; <= 0 = round-trip
};

// Quote if the field contains the delimiter, a quote or a line break.
std::string csv_escape(const std::string& s, char delim);

std::string csv_double(double x, int precision);

// Write `text` to `file_path`. Returns false (and logs) on any I/O failure.
bool write_text_file(const std::string& text, const std::string& file_path);

}  // namespace safcast
