#pragma once

#include "stockcast/core/calendar.hpp"

#include <optional>
#include <vector>

namespace stockcast::core {

/// Summed quantity of one truncated date as returned by a series source.
struct RawBucket {
	Date bucket_start;
	double quantity = 0.0;
};

/// A predicted bucket: non-negative and rounded to two decimals.
struct ForecastPoint {
	Date bucket_start;
	double quantity = 0.0;
};

using ForecastSeries = std::vector<ForecastPoint>;

/**
 * @brief Result of a forecast attempt.
 *
 * An empty optional means the model could not be fitted; it is never
 * represented by an empty series, so an all-zero forecast stays distinct.
 */
using ForecastOutcome = std::optional<ForecastSeries>;

/// Final output unit consumed by the report and export layers.
struct DemandRecord {
	Date date;
	double quantity = 0.0;
	bool is_forecast = false;

	friend bool operator==(const DemandRecord &lhs, const DemandRecord &rhs) {
		return lhs.date == rhs.date && lhs.quantity == rhs.quantity && lhs.is_forecast == rhs.is_forecast;
	}
	friend bool operator!=(const DemandRecord &lhs, const DemandRecord &rhs) {
		return !(lhs == rhs);
	}
};

} // namespace stockcast::core
