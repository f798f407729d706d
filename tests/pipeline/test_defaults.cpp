#include <catch2/catch.hpp>

#include "stockcast/pipeline/defaults.hpp"
#include "common/series_helpers.hpp"

#include <map>
#include <stdexcept>
#include <string>

using stockcast::core::Interval;
using stockcast::pipeline::ForecastDefaults;
using stockcast::pipeline::ForecastMethod;
using tests::helpers::date;

TEST_CASE("ForecastDefaults uses built-in values without settings", "[pipeline][defaults]") {
	const auto defaults = ForecastDefaults::fromSettings({});
	REQUIRE(defaults.interval == Interval::Month);
	REQUIRE(defaults.predicted_periods == 1);
	REQUIRE(defaults.method == ForecastMethod::AR);
}

TEST_CASE("ForecastDefaults reads settings", "[pipeline][defaults]") {
	const std::map<std::string, std::string> settings {{"stock_qty_forecast_interval", "week"},
	                                                   {"stock_qty_predicted_periods", "4"},
	                                                   {"stock_qty_forecast_method", "_arima_method"}};
	const auto defaults = ForecastDefaults::fromSettings(settings);
	REQUIRE(defaults.interval == Interval::Week);
	REQUIRE(defaults.predicted_periods == 4);
	REQUIRE(defaults.method == ForecastMethod::ARIMA);

	REQUIRE_THROWS_AS(ForecastDefaults::fromSettings({{"stock_qty_predicted_periods", "0"}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ForecastDefaults::fromSettings({{"stock_qty_predicted_periods", "3x"}}), std::invalid_argument);
	REQUIRE_THROWS_AS(ForecastDefaults::fromSettings({{"stock_qty_forecast_interval", "hour"}}),
	                  std::invalid_argument);
}

TEST_CASE("defaultSeasons and pinnedPeriods", "[pipeline][defaults]") {
	using stockcast::pipeline::defaultSeasons;
	using stockcast::pipeline::pinnedPeriods;
	REQUIRE(defaultSeasons(Interval::Day) == 7);
	REQUIRE(defaultSeasons(Interval::Week) == 1);
	REQUIRE(defaultSeasons(Interval::Month) == 3);
	REQUIRE(defaultSeasons(Interval::Quarter) == 2);
	REQUIRE(defaultSeasons(Interval::Year) == 1);

	REQUIRE(pinnedPeriods(ForecastMethod::HWES, 6) == 1);
	REQUIRE(pinnedPeriods(ForecastMethod::SES, 6) == 1);
	REQUIRE(pinnedPeriods(ForecastMethod::SARIMA, 6) == 6);
}

TEST_CASE("newRequest derives interval and method dependent fields", "[pipeline][defaults]") {
	ForecastDefaults defaults;
	defaults.predicted_periods = 4;

	auto request = stockcast::pipeline::newRequest(defaults, date("2024-03-15"));
	REQUIRE(request.interval == Interval::Month);
	REQUIRE(request.date_end == date("2024-02-29"));
	REQUIRE_FALSE(request.date_start.has_value());
	REQUIRE(request.parameters.seasons == 3);
	REQUIRE(request.predicted_periods == 4);
	REQUIRE(request.parameters.lags == 0);
	REQUIRE(request.parameters.p == 1);
	REQUIRE(request.parameters.seasonal_q == 1);

	request.interval = Interval::Day;
	stockcast::pipeline::onIntervalChanged(request, date("2024-03-15"));
	REQUIRE(request.date_end == date("2024-03-14"));
	REQUIRE(request.parameters.seasons == 7);

	request.parameters.method = ForecastMethod::SES;
	stockcast::pipeline::onMethodChanged(request, defaults);
	REQUIRE(request.predicted_periods == 1);

	request.parameters.method = ForecastMethod::ARIMA;
	stockcast::pipeline::onMethodChanged(request, defaults);
	REQUIRE(request.predicted_periods == 4);
}
