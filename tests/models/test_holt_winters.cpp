#include <catch2/catch.hpp>

#include "stockcast/models/holt_winters.hpp"
#include "common/series_helpers.hpp"

#include <stdexcept>
#include <vector>

using stockcast::models::HoltWinters;
using stockcast::models::HoltWintersConfig;
using stockcast::models::HoltWintersSeason;
using stockcast::models::HoltWintersTrend;

TEST_CASE("HoltWinters validates its configuration", "[models][holt_winters][validation]") {
	HoltWintersConfig bad_alpha;
	bad_alpha.alpha = 1.5;
	REQUIRE_THROWS_AS(HoltWinters(bad_alpha), std::invalid_argument);

	HoltWintersConfig no_period;
	no_period.season = HoltWintersSeason::Additive;
	no_period.seasonal_period = 1;
	REQUIRE_THROWS_AS(HoltWinters(no_period), std::invalid_argument);

	HoltWinters model;
	REQUIRE_THROWS_AS(model.predict(1), std::runtime_error);
	REQUIRE_THROWS_AS(model.fit(stockcast::core::TimeSeries()), std::invalid_argument);
}

TEST_CASE("HoltWinters without trend or season tracks the level", "[models][holt_winters][fit]") {
	HoltWinters model;
	model.fit(tests::helpers::makeDailySeries({5.0, 5.0, 5.0, 5.0, 5.0, 5.0}));

	REQUIRE(model.getName() == "HoltWinters");
	REQUIRE(model.sse() == Catch::Detail::Approx(0.0).margin(1e-9));
	const auto forecast = model.predict(3);
	REQUIRE(forecast.primary().size() == 3);
	for (double value : forecast.primary()) {
		REQUIRE(value == Catch::Detail::Approx(5.0).margin(1e-9));
	}
	REQUIRE(model.predict(0).empty());
}

TEST_CASE("HoltWinters estimates parameters within bounds", "[models][holt_winters][fit]") {
	HoltWinters model;
	model.fit(tests::helpers::makeDailySeries({3.0, 8.0, 2.0, 7.0, 4.0, 9.0, 3.0, 6.0, 5.0, 8.0}));

	REQUIRE(model.alpha() >= 0.0);
	REQUIRE(model.alpha() <= 1.0);
	REQUIRE(model.beta() == 0.0);
	REQUIRE(model.gamma() == 0.0);
	const auto forecast = model.predict(1);
	REQUIRE(forecast.primary()[0] >= 2.0);
	REQUIRE(forecast.primary()[0] <= 9.0);
}

TEST_CASE("HoltWinters with additive trend extrapolates a line", "[models][holt_winters][trend]") {
	std::vector<double> data;
	for (int t = 0; t < 20; ++t) {
		data.push_back(10.0 + 2.0 * t);
	}
	HoltWintersConfig config;
	config.trend = HoltWintersTrend::Additive;
	HoltWinters model(config);
	model.fit(tests::helpers::makeDailySeries(data));

	const auto forecast = model.predict(2);
	REQUIRE(forecast.primary()[0] == Catch::Detail::Approx(50.0).margin(0.5));
	REQUIRE(forecast.primary()[1] == Catch::Detail::Approx(52.0).margin(1.0));
}

TEST_CASE("HoltWinters with additive season repeats the pattern", "[models][holt_winters][season]") {
	const std::vector<double> pattern {1.0, 5.0, 3.0, 7.0};
	std::vector<double> data;
	for (int cycle = 0; cycle < 3; ++cycle) {
		data.insert(data.end(), pattern.begin(), pattern.end());
	}

	HoltWintersConfig config;
	config.season = HoltWintersSeason::Additive;
	config.seasonal_period = 4;
	HoltWinters model(config);
	model.fit(tests::helpers::makeDailySeries(data));

	const auto forecast = model.predict(4);
	for (std::size_t i = 0; i < pattern.size(); ++i) {
		REQUIRE(forecast.primary()[i] == Catch::Detail::Approx(pattern[i]).margin(1e-6));
	}

	HoltWinters short_model(config);
	REQUIRE_THROWS_AS(short_model.fit(tests::helpers::makeDailySeries({1.0, 5.0, 3.0, 7.0, 1.0})),
	                  std::invalid_argument);
}

TEST_CASE("HoltWinters keeps fixed smoothing parameters", "[models][holt_winters][config]") {
	HoltWintersConfig config;
	config.alpha = 0.3;
	HoltWinters model(config);
	model.fit(tests::helpers::makeDailySeries({4.0, 6.0, 5.0, 7.0}));
	REQUIRE(model.alpha() == Catch::Detail::Approx(0.3));
}
