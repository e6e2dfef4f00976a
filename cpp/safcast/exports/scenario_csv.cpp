#include "safcast/exports/scenario_csv.hpp"

#include <sstream>

#include "safcast/core/horizon.hpp"

namespace safcast {

std::string scenario_csv_header(const CsvExportOptions& opt) {
  std::ostringstream h;
  h << kYearColumnName;
  for (Column c : all_columns()) h << opt.delimiter << column_name(c);
  return h.str();
}

std::string scenario_row_to_csv(const ScenarioRow& r, const CsvExportOptions& opt) {
  std::ostringstream row;
  row << r.year;
  for (Column c : all_columns()) row << opt.delimiter << csv_double(column_value(r, c), opt.precision);
  return row.str();
}

std::string scenario_to_csv(const ScenarioResult& r, const CsvExportOptions& opt) {
  std::ostringstream out;
  if (opt.include_header) out << scenario_csv_header(opt) << "\n";
  for (const auto& row : r.rows()) out << scenario_row_to_csv(row, opt) << "\n";
  return out.str();
}

bool write_scenario_csv_file(const ScenarioResult& r, const std::string& file_path, const CsvExportOptions& opt) {
  return write_text_file(scenario_to_csv(r, opt), file_path);
}

std::string metric_comparison_to_csv(const std::vector<CaseResult>& cases,
                                     Column metric,
                                     const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  std::ostringstream out;

  if (opt.include_header) {
    out << kYearColumnName;
    for (const auto& c : cases) out << d << csv_escape(c.label, d);
    out << "\n";
  }

  for (std::size_t i = 0; i < horizon::kYears; ++i) {
    out << horizon::year_at(i);
    for (const auto& c : cases) out << d << csv_double(column_value(c.result.rows()[i], metric), opt.precision);
    out << "\n";
  }
  return out.str();
}

bool write_metric_comparison_csv_file(const std::vector<CaseResult>& cases,
                                      Column metric,
                                      const std::string& file_path,
                                      const CsvExportOptions& opt) {
  return write_text_file(metric_comparison_to_csv(cases, metric, opt), file_path);
}

std::string summaries_to_csv(const std::vector<ScenarioSummary>& summaries, const CsvExportOptions& opt) {
  const char d = opt.delimiter;
  const int p = opt.precision;
  std::ostringstream out;

  if (opt.include_header) {
    out << "label" << d << "scenario" << d
        << "cumulative_demand_Mt" << d
        << "cumulative_SAF_Mt" << d
        << "cumulative_CO2_generated_Mt" << d
        << "cumulative_CO2_avoided_Mt" << d
        << "cumulative_fuel_cost_Bn" << d
        << "cumulative_carbon_cost_Bn" << d
        << "cumulative_total_cost_Bn" << d
        << "final_SAF_share_%" << d
        << "final_CO2_generated_Mt" << "\n";
  }

  for (const auto& s : summaries) {
    out << csv_escape(s.label, d) << d << to_string(s.scenario) << d
        << csv_double(s.cumulative_demand_mt, p) << d
        << csv_double(s.cumulative_saf_mt, p) << d
        << csv_double(s.cumulative_co2_generated_mt, p) << d
        << csv_double(s.cumulative_co2_avoided_mt, p) << d
        << csv_double(s.cumulative_fuel_cost_bn, p) << d
        << csv_double(s.cumulative_carbon_cost_bn, p) << d
        << csv_double(s.cumulative_total_cost_bn, p) << d
        << csv_double(s.final_share_pct, p) << d
        << csv_double(s.final_co2_generated_mt, p) << "\n";
  }
  return out.str();
}

bool write_summary_csv_file(const std::vector<ScenarioSummary>& summaries,
                            const std::string& file_path,
                            const CsvExportOptions& opt) {
  return write_text_file(summaries_to_csv(summaries, opt), file_path);
}

}  // namespace safcast
