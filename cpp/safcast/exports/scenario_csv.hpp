#pragma once
/*
================================================================================
Fragment 3.1 - Exports: Scenario Result CSV
FILE: cpp/safcast/exports/scenario_csv.hpp

Outputs:
  - Result table: Year + every result column (stable names), one row per year.
  - Metric comparison: Year + one column per labelled case for one metric,
    i.e. the series a scenario-comparison chart plots.
  - Summary: one row per labelled case with horizon-cumulative totals.

Hardening:
  - Stable column order for diff-friendly output.
  - NaN/unset values export as empty cells.
  - Writers return false on I/O failure; nothing is thrown for a bad path.
================================================================================
*/

#include <string>
#include <vector>

#include "safcast/exports/csv_format.hpp"
#include "safcast/model/scenario_result.hpp"
#include "safcast/model/study.hpp"
#include "safcast/model/summary.hpp"

namespace safcast {

std::string scenario_csv_header(const CsvExportOptions& opt = CsvExportOptions());

std::string scenario_row_to_csv(const ScenarioRow& r, const CsvExportOptions& opt = CsvExportOptions());

// Header (if enabled) and all rows, newline-terminated.
std::string scenario_to_csv(const ScenarioResult& r, const CsvExportOptions& opt = CsvExportOptions());

bool write_scenario_csv_file(const ScenarioResult& r,
                             const std::string& file_path,
                             const CsvExportOptions& opt = CsvExportOptions());

std::string metric_comparison_to_csv(const std::vector<CaseResult>& cases,
                                     Column metric,
                                     const CsvExportOptions& opt = CsvExportOptions());

bool write_metric_comparison_csv_file(const std::vector<CaseResult>& cases,
                                      Column metric,
                                      const std::string& file_path,
                                      const CsvExportOptions& opt = CsvExportOptions());

std::string summaries_to_csv(const std::vector<ScenarioSummary>& summaries,
                             const CsvExportOptions& opt = CsvExportOptions());

bool write_summary_csv_file(const std::vector<ScenarioSummary>& summaries,
                            const std::string& file_path,
                            const CsvExportOptions& opt = CsvExportOptions());

}  // namespace safcast
