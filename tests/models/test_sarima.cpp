#include <catch2/catch.hpp>

#include "stockcast/models/arima.hpp"
#include "common/series_helpers.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using stockcast::models::ARIMABuilder;

namespace {

std::vector<double> repeatPattern(const std::vector<double> &pattern, int cycles, double drift = 0.0) {
	std::vector<double> data;
	for (int c = 0; c < cycles; ++c) {
		for (double value : pattern) {
			data.push_back(value + drift * static_cast<double>(data.size()));
		}
	}
	return data;
}

} // namespace

TEST_CASE("SARIMA requires a seasonal period of at least two", "[models][sarima][builder]") {
	REQUIRE_THROWS_AS(ARIMABuilder().withSeasonalAR(1).withSeasonalPeriod(1).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(ARIMABuilder().withSeasonalDifferencing(1).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(ARIMABuilder().withSeasonalPeriod(-4).build(), std::invalid_argument);
	REQUIRE_NOTHROW(ARIMABuilder().withSeasonalMA(1).withSeasonalPeriod(4).build());
}

TEST_CASE("SARIMA seasonal differencing repeats the last season", "[models][sarima][forecast]") {
	const auto data = repeatPattern({10.0, 20.0, 30.0, 40.0}, 3);
	auto model = ARIMABuilder().withSeasonalDifferencing(1).withSeasonalPeriod(4).build();
	REQUIRE(model->getName() == "SARIMA");
	REQUIRE(model->minimumObservations() == 5);

	model->fit(tests::helpers::makeDailySeries(data));
	const auto forecast = model->predict(6);
	const std::vector<double> expected {10.0, 20.0, 30.0, 40.0, 10.0, 20.0};
	REQUIRE(forecast.primary().size() == expected.size());
	for (std::size_t i = 0; i < expected.size(); ++i) {
		REQUIRE(forecast.primary()[i] == Catch::Detail::Approx(expected[i]).margin(1e-9));
	}
}

TEST_CASE("SARIMA combines trend and seasonal differencing", "[models][sarima][forecast]") {
	const auto data = repeatPattern({5.0, 9.0, 7.0}, 4, 1.0);
	auto model =
	    ARIMABuilder().withDifferencing(1).withSeasonalDifferencing(1).withSeasonalPeriod(3).build();
	model->fit(tests::helpers::makeDailySeries(data));

	// Pattern plus a unit drift per step continues exactly.
	const auto forecast = model->predict(3);
	const double n = static_cast<double>(data.size());
	REQUIRE(forecast.primary()[0] == Catch::Detail::Approx(5.0 + n).margin(1e-9));
	REQUIRE(forecast.primary()[1] == Catch::Detail::Approx(9.0 + n + 1.0).margin(1e-9));
	REQUIRE(forecast.primary()[2] == Catch::Detail::Approx(7.0 + n + 2.0).margin(1e-9));
}

TEST_CASE("SARIMA with seasonal AR and MA terms fits", "[models][sarima][fit]") {
	const std::vector<double> data {12.0, 30.0, 22.0, 8.0,  14.0, 33.0, 21.0, 9.0,  13.0, 35.0, 24.0, 10.0,
	                                15.0, 34.0, 25.0, 11.0, 16.0, 37.0, 26.0, 10.0, 17.0, 38.0, 27.0, 12.0};
	auto model = ARIMABuilder()
	                 .withAR(1)
	                 .withDifferencing(1)
	                 .withMA(1)
	                 .withSeasonalAR(1)
	                 .withSeasonalDifferencing(1)
	                 .withSeasonalMA(1)
	                 .withSeasonalPeriod(4)
	                 .build();
	REQUIRE(model->minimumObservations() == 11);
	model->fit(tests::helpers::makeDailySeries(data));

	REQUIRE(model->seasonalARCoefficients().size() == 1);
	REQUIRE(model->seasonalMACoefficients().size() == 1);
	const auto forecast = model->predict(4);
	REQUIRE(forecast.primary().size() == 4);
	for (double value : forecast.primary()) {
		REQUIRE(std::isfinite(value));
	}
}

TEST_CASE("SARIMA rejects too short seasonal histories", "[models][sarima][validation]") {
	auto model = ARIMABuilder().withSeasonalAR(1).withSeasonalDifferencing(1).withSeasonalPeriod(12).build();
	REQUIRE_THROWS_AS(model->fit(tests::helpers::makeDailySeries({1.0, 2.0, 3.0, 4.0, 5.0, 6.0})),
	                  std::invalid_argument);
}

TEST_CASE("SARIMA with AR and MA terms continues a drifting season", "[models][sarima][drift]") {
	// Period-4 pattern plus 2 per step: both differences leave nothing to explain.
	const auto data = repeatPattern({5.0, 9.0, 7.0, 11.0}, 6, 2.0);
	auto model = ARIMABuilder()
	                 .withAR(1)
	                 .withDifferencing(1)
	                 .withMA(1)
	                 .withSeasonalAR(1)
	                 .withSeasonalDifferencing(1)
	                 .withSeasonalMA(1)
	                 .withSeasonalPeriod(4)
	                 .build();
	model->fit(tests::helpers::makeDailySeries(data));
	REQUIRE(model->sigma2() == Catch::Detail::Approx(0.0).margin(1e-12));

	const auto forecast = model->predict(4);
	const std::vector<double> expected {53.0, 59.0, 59.0, 65.0};
	for (std::size_t i = 0; i < expected.size(); ++i) {
		REQUIRE(forecast.primary()[i] == Catch::Detail::Approx(expected[i]).margin(1e-6));
	}
}

TEST_CASE("SARIMA seasonal AR on differences keeps the trend", "[models][sarima][drift]") {
	std::vector<double> data;
	const std::vector<double> pattern {5.0, 9.0, 7.0, 11.0};
	for (int i = 0; i < 24; ++i) {
		data.push_back(pattern[i % 4] + 2.0 * i + (i % 2 == 1 ? 0.5 : -0.5));
	}
	auto model =
	    ARIMABuilder().withAR(1).withDifferencing(1).withSeasonalAR(1).withSeasonalPeriod(4).build();
	model->fit(tests::helpers::makeDailySeries(data));

	REQUIRE(model->arCoefficients()[0] == Catch::Detail::Approx(0.0).margin(1e-9));
	REQUIRE(model->seasonalARCoefficients()[0] == Catch::Detail::Approx(1.0).margin(1e-9));
	const auto forecast = model->predict(4);
	const std::vector<double> expected {52.5, 59.5, 58.5, 65.5};
	for (std::size_t i = 0; i < expected.size(); ++i) {
		REQUIRE(forecast.primary()[i] == Catch::Detail::Approx(expected[i]).margin(1e-6));
	}
}
