#pragma once

#include "stockcast/core/demand.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace stockcast::report {

/// Records sorted ascending by date, as shown in the demand report.
std::vector<core::DemandRecord> reportOrder(std::vector<core::DemandRecord> records);

/// Records sorted descending by date, as written to the spreadsheet export.
std::vector<core::DemandRecord> exportOrder(std::vector<core::DemandRecord> records);

/// "<target_name>#<YYYY-MM-DD>.xlsx"
std::string exportFileName(const std::string &target_name, const core::Date &today);

struct DelimitedOptions {
	char delimiter = ',';
	bool write_header = true;
	/// Text of the trailing column on forecast rows; history rows leave it empty.
	std::string forecast_marker = "forecast";
};

/**
 * @brief Writes the records as a delimited table in export order.
 *
 * Columns are Date, Demand and Type; Type holds the forecast marker on
 * forecast rows and is empty for history rows.
 */
void writeDelimited(std::ostream &out, const std::vector<core::DemandRecord> &records,
                    const DelimitedOptions &options = {});

/// User facing notice shown when a request has no stock operations.
struct NoDataNotice {
	static constexpr const char *kTitle = "Not enough stock operations in the period";
	static constexpr const char *kMessage = "No historical data is defined for the specified period";

	std::string title = kTitle;
	std::string message = kMessage;
	bool sticky = false;
};

} // namespace stockcast::report
