#include <catch2/catch.hpp>

#include "stockcast/models/autoregression.hpp"
#include "common/series_helpers.hpp"

#include <stdexcept>
#include <vector>

using stockcast::models::AutoRegressionBuilder;

TEST_CASE("AutoRegression builder validates lags", "[models][ar][builder]") {
	REQUIRE_THROWS_AS(AutoRegressionBuilder().withLags(-1).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(AutoRegressionBuilder().withLags(0).withConstant(false).build(), std::invalid_argument);
	REQUIRE_NOTHROW(AutoRegressionBuilder().withLags(0).build());
}

TEST_CASE("AutoRegression recovers an exact AR(1) process", "[models][ar][fit]") {
	const auto data = tests::helpers::generateARSeries(0.8, 10.0, 20);
	auto model = AutoRegressionBuilder().withLags(1).build();
	model->fit(tests::helpers::makeDailySeries(data));

	REQUIRE(model->lags() == 1);
	REQUIRE(model->arCoefficients()[0] == Catch::Detail::Approx(0.8).margin(1e-6));
	REQUIRE(model->intercept() == Catch::Detail::Approx(0.0).margin(1e-6));

	const auto forecast = model->predict(3);
	REQUIRE(forecast.horizon() == 3);
	double expected = data.back();
	for (double value : forecast.primary()) {
		expected *= 0.8;
		REQUIRE(value == Catch::Detail::Approx(expected).margin(1e-6));
	}
}

TEST_CASE("AutoRegression with zero lags forecasts the mean", "[models][ar][fit]") {
	auto model = AutoRegressionBuilder().withLags(0).build();
	model->fit(tests::helpers::makeDailySeries({2.0, 4.0, 9.0}));
	const auto forecast = model->predict(2);
	REQUIRE(forecast.primary().size() == 2);
	REQUIRE(forecast.primary()[0] == Catch::Detail::Approx(5.0));
	REQUIRE(forecast.primary()[1] == Catch::Detail::Approx(5.0));
}

TEST_CASE("AutoRegression requires enough observations", "[models][ar][validation]") {
	auto model = AutoRegressionBuilder().withLags(2).build();
	REQUIRE_THROWS_AS(model->fit(tests::helpers::makeDailySeries({1.0, 2.0, 3.0, 4.0})), std::invalid_argument);
	REQUIRE_NOTHROW(model->fit(tests::helpers::makeDailySeries({1.0, 3.0, 2.0, 5.0, 4.0})));

	auto single = AutoRegressionBuilder().withLags(0).build();
	REQUIRE_NOTHROW(single->fit(tests::helpers::makeDailySeries({7.0})));
	REQUIRE(single->predict(1).primary()[0] == Catch::Detail::Approx(7.0));
}

TEST_CASE("AutoRegression predict before fit throws", "[models][ar]") {
	auto model = AutoRegressionBuilder().build();
	REQUIRE_THROWS_AS(model->predict(1), std::runtime_error);
}
