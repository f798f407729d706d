#include <catch2/catch.hpp>

#include "stockcast/models/ses.hpp"
#include "common/series_helpers.hpp"

#include <stdexcept>
#include <vector>

using stockcast::models::SimpleExponentialSmoothing;
using stockcast::models::SimpleExponentialSmoothingBuilder;

TEST_CASE("SES with fixed alpha smooths the level", "[models][ses]") {
	auto model = SimpleExponentialSmoothingBuilder().withAlpha(0.5).build();
	REQUIRE_FALSE(model->isOptimized());
	model->fit(tests::helpers::makeDailySeries({10.0, 20.0}));

	// SSE = (10 - l0)^2 + (15 - l0 / 2)^2 is smallest at l0 = 14.
	REQUIRE(model->alpha() == Catch::Detail::Approx(0.5));
	REQUIRE(model->initialLevel() == Catch::Detail::Approx(14.0).margin(1e-3));
	REQUIRE(model->level() == Catch::Detail::Approx(16.0).margin(1e-3));
	REQUIRE(model->mse() == Catch::Detail::Approx(40.0).margin(1e-3));
	const auto forecast = model->predict(3);
	REQUIRE(forecast.primary().size() == 3);
	for (double value : forecast.primary()) {
		REQUIRE(value == Catch::Detail::Approx(16.0).margin(1e-3));
	}
}

TEST_CASE("SES estimates the level before the first observation", "[models][ses][level]") {
	// The first observation is an outlier; the level starts from the bulk of the data.
	auto model = SimpleExponentialSmoothingBuilder().withAlpha(0.1).build();
	model->fit(tests::helpers::makeDailySeries({2.0, 10.0, 10.0, 10.0, 10.0, 10.0, 10.0, 10.0}));

	REQUIRE(model->initialLevel() > 5.0);
	REQUIRE(model->level() > 9.0);
	REQUIRE(model->predict(1).primary()[0] == Catch::Detail::Approx(model->level()));
}

TEST_CASE("SES optimizes alpha when none is configured", "[models][ses][optimized]") {
	std::vector<double> rising;
	for (int i = 1; i <= 10; ++i) {
		rising.push_back(static_cast<double>(i));
	}
	auto model = SimpleExponentialSmoothingBuilder().build();
	REQUIRE(model->isOptimized());
	model->fit(tests::helpers::makeDailySeries(rising));

	REQUIRE(model->alpha() == Catch::Detail::Approx(1.0).margin(0.01));
	REQUIRE(model->initialLevel() == Catch::Detail::Approx(1.0).margin(0.05));
	REQUIRE(model->mse() == Catch::Detail::Approx(0.9).margin(0.01));
	REQUIRE(model->predict(1).primary()[0] == Catch::Detail::Approx(10.0).margin(0.02));

	auto flat = SimpleExponentialSmoothingBuilder().build();
	flat->fit(tests::helpers::makeDailySeries({4.0, 4.0, 4.0}));
	REQUIRE(flat->mse() == Catch::Detail::Approx(0.0).margin(1e-12));
	REQUIRE(flat->level() == Catch::Detail::Approx(4.0));

	double mse = -1.0;
	REQUIRE(SimpleExponentialSmoothing::optimizeAlpha({4.0, 4.0, 4.0}, &mse) == Catch::Detail::Approx(0.01));
	REQUIRE(mse == Catch::Detail::Approx(0.0));
	REQUIRE(SimpleExponentialSmoothing::optimizeAlpha({4.0}) == Catch::Detail::Approx(0.5));
}

TEST_CASE("SES validates its inputs", "[models][ses][validation]") {
	REQUIRE_THROWS_AS(SimpleExponentialSmoothingBuilder().withAlpha(1.5).build(), std::invalid_argument);

	auto model = SimpleExponentialSmoothingBuilder().withOptimizedAlpha().build();
	REQUIRE_THROWS_AS(model->predict(1), std::runtime_error);
	REQUIRE_THROWS_AS(model->fit(stockcast::core::TimeSeries()), std::invalid_argument);

	model->fit(tests::helpers::makeDailySeries({3.0}));
	REQUIRE(model->predict(1).primary()[0] == Catch::Detail::Approx(3.0));
	REQUIRE_THROWS_AS(model->predict(-1), std::invalid_argument);
	REQUIRE(model->predict(0).empty());
}
