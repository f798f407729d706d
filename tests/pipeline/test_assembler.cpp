#include <catch2/catch.hpp>

#include "stockcast/pipeline/assembler.hpp"
#include "common/series_helpers.hpp"

#include <stdexcept>

using stockcast::core::DemandRecord;
using stockcast::core::ForecastPoint;
using stockcast::core::ForecastSeries;
using stockcast::pipeline::assembleDemand;
using tests::helpers::date;

TEST_CASE("assembleDemand appends forecast after history", "[pipeline][assembler]") {
	const auto history = tests::helpers::makeDailySeries({5.0, 0.0, 7.0});
	const ForecastSeries forecast {{date("2024-01-04"), 6.5}, {date("2024-01-05"), 6.25}};

	const auto records = assembleDemand(history, forecast);
	REQUIRE(records.size() == 5);
	REQUIRE(records[0] == DemandRecord {date("2024-01-01"), 5.0, false});
	REQUIRE(records[1] == DemandRecord {date("2024-01-02"), 0.0, false});
	REQUIRE(records[2] == DemandRecord {date("2024-01-03"), 7.0, false});
	REQUIRE(records[3] == DemandRecord {date("2024-01-04"), 6.5, true});
	REQUIRE(records[4] == DemandRecord {date("2024-01-05"), 6.25, true});
}

TEST_CASE("assembleDemand keeps history only when forecast is unavailable", "[pipeline][assembler]") {
	const auto history = tests::helpers::makeDailySeries({3.0, 4.0});
	const auto records = assembleDemand(history, std::nullopt);
	REQUIRE(records.size() == 2);
	for (const auto &record : records) {
		REQUIRE_FALSE(record.is_forecast);
	}
}

TEST_CASE("assembleDemand keeps an all-zero forecast", "[pipeline][assembler]") {
	const auto history = tests::helpers::makeDailySeries({1.0});
	const auto records = assembleDemand(history, ForecastSeries {{date("2024-01-02"), 0.0}});
	REQUIRE(records.size() == 2);
	REQUIRE(records.back().is_forecast);
	REQUIRE(records.back().quantity == 0.0);

	// An available but empty forecast adds nothing.
	REQUIRE(assembleDemand(history, ForecastSeries {}).size() == 1);
}

TEST_CASE("assembleDemand rejects forecasts overlapping the history", "[pipeline][assembler][validation]") {
	const auto history = tests::helpers::makeDailySeries({1.0, 2.0});
	REQUIRE_THROWS_AS(assembleDemand(history, ForecastSeries {{date("2024-01-02"), 3.0}}), std::invalid_argument);
}
