#pragma once
/*
================================================================================
Fragment 3.2 - Exports: Demand CSV (Forecast Breakdown Out, Demand Series In)
FILE: cpp/safcast/exports/demand_csv.hpp

Writer:
  Year,Raw_Demand_Mt,Tech_Efficiency_Factor,Demand_After_Tech_Gains_Mt,
  Operational_Efficiency_Factor,Total_Fuel_Demand_Mt

Reader:
  - Needs a header with "Year" and "Total_Fuel_Demand_Mt" (case-insensitive,
    any position; other columns ignored). Blank lines skipped.
  - kParseError     : missing header/columns, unparsable cell
  - kMalformedSeries: horizon not covered exactly once, negative demand
  - kIoError        : unreadable file
================================================================================
*/

#include <string>

#include "safcast/exports/csv_format.hpp"
#include "safcast/model/demand_series.hpp"
#include "safcast/model/forecast.hpp"

namespace safcast {

std::string forecast_to_csv(const ForecastBreakdown& f, const CsvExportOptions& opt = CsvExportOptions());

bool write_forecast_csv_file(const ForecastBreakdown& f,
                             const std::string& file_path,
                             const CsvExportOptions& opt = CsvExportOptions());

DemandSeries parse_demand_csv(const std::string& csv_text, const std::string& origin = "<csv>");

DemandSeries load_demand_csv_file(const std::string& file_path);

}  // namespace safcast
