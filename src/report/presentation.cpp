#include "stockcast/report/presentation.hpp"

#include <algorithm>
#include <spdlog/fmt/fmt.h>

namespace stockcast::report {

std::vector<core::DemandRecord> reportOrder(std::vector<core::DemandRecord> records) {
	std::stable_sort(records.begin(), records.end(), [](const core::DemandRecord &lhs, const core::DemandRecord &rhs) {
		return lhs.date < rhs.date;
	});
	return records;
}

std::vector<core::DemandRecord> exportOrder(std::vector<core::DemandRecord> records) {
	std::stable_sort(records.begin(), records.end(), [](const core::DemandRecord &lhs, const core::DemandRecord &rhs) {
		return lhs.date > rhs.date;
	});
	return records;
}

std::string exportFileName(const std::string &target_name, const core::Date &today) {
	return fmt::format("{}#{}.xlsx", target_name, today.toString());
}

void writeDelimited(std::ostream &out, const std::vector<core::DemandRecord> &records,
                    const DelimitedOptions &options) {
	const char sep = options.delimiter;
	if (options.write_header) {
		out << "Date" << sep << "Demand" << sep << "Type" << "\n";
	}
	for (const auto &record : exportOrder(records)) {
		out << record.date.toString() << sep << fmt::format("{:.2f}", record.quantity) << sep
		    << (record.is_forecast ? options.forecast_marker : std::string()) << "\n";
	}
}

} // namespace stockcast::report
