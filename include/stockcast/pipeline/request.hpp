#pragma once

#include "stockcast/core/calendar.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace stockcast {

/**
 * @brief Thrown when a forecast request violates its invariants.
 *
 * Raised before any data is read, so a rejected request has no side effects.
 */
class InvalidRequest : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

namespace pipeline {

/// Which outbound moves make up the demand.
enum class DemandScope {
	Location, // moves leaving one location (optionally with its children)
	Company   // moves leaving any internal location of the company
};

enum class DemandTarget {
	Product,
	Template
};

enum class ForecastMethod {
	AR,
	ARDL,
	ARIMA,
	SARIMA,
	HWES,
	SES
};

/// Stable configuration key of a method: "ar", "ardl", "arima", "sarima", "hwes" or "ses".
std::string toString(ForecastMethod method);

/**
 * @brief Parses a method key.
 *
 * Accepts the plain keys produced by toString() and the prefixed legacy
 * settings values ("_ar_method", "_ma_method", ...).
 * @throws std::invalid_argument For an unknown key.
 */
ForecastMethod parseMethod(const std::string &key);

/// Methods whose forecast is always a single bucket.
bool isSinglePeriodMethod(ForecastMethod method);

/**
 * @struct ForecastParameters
 * @brief Method selection and hyperparameters. Each method reads only the fields it needs.
 */
struct ForecastParameters {
	ForecastMethod method = ForecastMethod::AR;
	int lags = 0;
	int p = 1;
	int d = 1;
	int q = 1;
	int seasonal_p = 1;
	int seasonal_d = 1;
	int seasonal_q = 1;
	int seasons = 1;
};

/**
 * @struct ForecastRequest
 * @brief Fully resolved parameters of one demand computation.
 */
struct ForecastRequest {
	DemandScope scope = DemandScope::Location;
	DemandTarget target = DemandTarget::Product;
	std::int64_t target_id = 0;
	std::optional<std::int64_t> location_id;
	bool include_children = true;
	std::optional<core::Date> date_start;
	std::optional<core::Date> date_end;
	core::Interval interval = core::Interval::Month;
	int predicted_periods = 1;
	ForecastParameters parameters;

	/**
	 * @brief Checks the request invariants.
	 * @throws InvalidRequest If predicted_periods is not positive, the date range
	 *         is not increasing, an order is negative, the target id is missing,
	 *         or location scope has no location.
	 */
	void validate() const;
};

} // namespace pipeline
} // namespace stockcast
