#include "stockcast/pipeline/defaults.hpp"
#include "stockcast/utils/logging.hpp"

#include <stdexcept>

namespace stockcast::pipeline {

namespace {

int parsePositiveInt(const std::string &key, const std::string &text) {
	std::size_t consumed = 0;
	int value = 0;
	try {
		value = std::stoi(text, &consumed);
	} catch (const std::exception &) {
		throw std::invalid_argument("Setting '" + key + "' is not an integer: '" + text + "'.");
	}
	if (consumed != text.size() || value <= 0) {
		throw std::invalid_argument("Setting '" + key + "' must be a positive integer: '" + text + "'.");
	}
	return value;
}

} // namespace

ForecastDefaults ForecastDefaults::fromSettings(const std::map<std::string, std::string> &settings) {
	ForecastDefaults defaults;
	if (auto it = settings.find(kIntervalKey); it != settings.end()) {
		defaults.interval = core::parseInterval(it->second);
	}
	if (auto it = settings.find(kPredictedPeriodsKey); it != settings.end()) {
		defaults.predicted_periods = parsePositiveInt(kPredictedPeriodsKey, it->second);
	}
	if (auto it = settings.find(kMethodKey); it != settings.end()) {
		defaults.method = parseMethod(it->second);
	}
	STOCKCAST_DEBUG("Forecast defaults: interval={}, periods={}, method={}", core::toString(defaults.interval),
	                defaults.predicted_periods, toString(defaults.method));
	return defaults;
}

int defaultSeasons(core::Interval interval) {
	switch (interval) {
	case core::Interval::Day:
		return 7;
	case core::Interval::Week:
		return 1;
	case core::Interval::Month:
		return 3;
	case core::Interval::Quarter:
		return 2;
	case core::Interval::Year:
		return 1;
	}
	throw std::invalid_argument("Unknown interval.");
}

int pinnedPeriods(ForecastMethod method, int periods) {
	return isSinglePeriodMethod(method) ? 1 : periods;
}

ForecastRequest newRequest(const ForecastDefaults &defaults, const core::Date &today) {
	ForecastRequest request;
	request.interval = defaults.interval;
	request.parameters.method = defaults.method;
	onIntervalChanged(request, today);
	onMethodChanged(request, defaults);
	return request;
}

void onIntervalChanged(ForecastRequest &request, const core::Date &today) {
	request.date_end = core::previousPeriodEnd(today, request.interval);
	request.parameters.seasons = defaultSeasons(request.interval);
}

void onMethodChanged(ForecastRequest &request, const ForecastDefaults &defaults) {
	request.predicted_periods = pinnedPeriods(request.parameters.method, defaults.predicted_periods);
}

} // namespace stockcast::pipeline
