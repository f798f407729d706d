#include "stockcast/pipeline/assembler.hpp"

#include <stdexcept>

namespace stockcast::pipeline {

std::vector<core::DemandRecord> assembleDemand(const core::TimeSeries &history,
                                               const core::ForecastOutcome &forecast) {
	std::vector<core::DemandRecord> records;
	records.reserve(history.size() + (forecast ? forecast->size() : 0));

	const auto &buckets = history.getBuckets();
	const auto &values = history.getValues();
	for (std::size_t i = 0; i < buckets.size(); ++i) {
		records.push_back(core::DemandRecord {buckets[i], values[i], false});
	}

	if (forecast) {
		for (const auto &point : *forecast) {
			if (!records.empty() && !(point.bucket_start > records.back().date)) {
				throw std::invalid_argument("Forecast bucket " + point.bucket_start.toString() +
				                            " does not follow the history.");
			}
			records.push_back(core::DemandRecord {point.bucket_start, point.quantity, true});
		}
	}
	return records;
}

} // namespace stockcast::pipeline
