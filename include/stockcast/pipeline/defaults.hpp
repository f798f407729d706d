#pragma once

#include "stockcast/pipeline/request.hpp"

#include <map>
#include <string>

namespace stockcast::pipeline {

/**
 * @struct ForecastDefaults
 * @brief Initial values of a new request, optionally read from key/value settings.
 */
struct ForecastDefaults {
	static constexpr const char *kIntervalKey = "stock_qty_forecast_interval";
	static constexpr const char *kPredictedPeriodsKey = "stock_qty_predicted_periods";
	static constexpr const char *kMethodKey = "stock_qty_forecast_method";

	core::Interval interval = core::Interval::Month;
	int predicted_periods = 1;
	ForecastMethod method = ForecastMethod::AR;

	/**
	 * @brief Reads defaults from settings; missing keys keep their built-in value.
	 * @throws std::invalid_argument If a present value cannot be parsed.
	 */
	static ForecastDefaults fromSettings(const std::map<std::string, std::string> &settings);
};

/// Seasonal period suggested for an interval: day 7, week 1, month 3, quarter 2, year 1.
int defaultSeasons(core::Interval interval);

/// Forecast length actually produced by @p method for @p periods requested.
int pinnedPeriods(ForecastMethod method, int periods);

/**
 * @brief Creates a request from the defaults.
 *
 * Interval dependent fields (date_end, seasons) and the method dependent
 * period count are filled in as if the user had just picked them. Scope,
 * target and ids are left for the caller.
 */
ForecastRequest newRequest(const ForecastDefaults &defaults, const core::Date &today);

/// Re-derives date_end and seasons after the interval of @p request changed.
void onIntervalChanged(ForecastRequest &request, const core::Date &today);

/// Re-derives predicted_periods after the method of @p request changed.
void onMethodChanged(ForecastRequest &request, const ForecastDefaults &defaults);

} // namespace stockcast::pipeline
