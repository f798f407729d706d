#include <catch2/catch.hpp>

#include "stockcast/source/sql_query.hpp"
#include "common/series_helpers.hpp"

#include <string>
#include <variant>

using stockcast::InvalidRequest;
using stockcast::pipeline::DemandScope;
using stockcast::pipeline::DemandTarget;
using stockcast::pipeline::ForecastRequest;
using stockcast::source::SqlQuery;
using stockcast::source::SqlQueryBuilder;
using stockcast::source::SqlSeriesSource;
using tests::helpers::date;

namespace {

ForecastRequest productAtLocation() {
	ForecastRequest request;
	request.target_id = 31;
	request.location_id = 8;
	return request;
}

bool contains(const std::string &text, const std::string &fragment) {
	return text.find(fragment) != std::string::npos;
}

} // namespace

TEST_CASE("SqlQueryBuilder groups done moves by truncated date", "[source][sql]") {
	const auto query = SqlQueryBuilder::build(productAtLocation(), 1);

	REQUIRE(contains(query.text, "DATE_TRUNC(:interval, date) AS date_gr"));
	REQUIRE(contains(query.text, "SUM(product_qty) AS qty"));
	REQUIRE(contains(query.text, "state = 'done'"));
	REQUIRE(contains(query.text, "AND company_id = :company_id"));
	REQUIRE(contains(query.text, "GROUP BY date_gr"));
	REQUIRE(contains(query.text, "ORDER BY date_gr"));
	REQUIRE(std::get<std::string>(query.params.at("interval")) == "month");
	REQUIRE(std::get<std::int64_t>(query.params.at("company_id")) == 1);
}

TEST_CASE("SqlQueryBuilder location scope with children uses a recursive CTE", "[source][sql][location]") {
	const auto query = SqlQueryBuilder::build(productAtLocation(), 1);

	REQUIRE(query.text.rfind("WITH RECURSIVE child_locs AS (", 0) == 0);
	REQUIRE(contains(query.text, "(location_id = :location_id OR id = :location_id) AND usage = 'internal'"));
	REQUIRE(contains(query.text, "AND location_id IN (SELECT id FROM child_locs)"));
	REQUIRE(contains(query.text, "AND location_dest_id NOT IN (SELECT id FROM child_locs)"));
	REQUIRE(contains(query.text, "AND product_id = :product_id"));
	REQUIRE(std::get<std::int64_t>(query.params.at("location_id")) == 8);
	REQUIRE(std::get<std::int64_t>(query.params.at("product_id")) == 31);
	REQUIRE(query.params.count("date_start") == 0);
}

TEST_CASE("SqlQueryBuilder location scope without children filters the source", "[source][sql][location]") {
	auto request = productAtLocation();
	request.include_children = false;
	const auto query = SqlQueryBuilder::build(request, 1);

	REQUIRE_FALSE(contains(query.text, "WITH"));
	REQUIRE(contains(query.text, "AND location_id = :location_id"));
	REQUIRE_FALSE(contains(query.text, "location_dest_id"));
}

TEST_CASE("SqlQueryBuilder company scope and template target", "[source][sql][company]") {
	ForecastRequest request;
	request.scope = DemandScope::Company;
	request.target = DemandTarget::Template;
	request.target_id = 5;
	request.date_start = date("2024-01-01");
	request.date_end = date("2024-03-31");
	const auto query = SqlQueryBuilder::build(request, 3);

	REQUIRE(query.text.rfind("WITH internal_locations AS (", 0) == 0);
	REQUIRE(contains(query.text, "WHERE company_id = :company_id AND usage = 'internal'"));
	REQUIRE(contains(query.text, ",\ntempl_products AS ("));
	REQUIRE(contains(query.text, "WHERE product_tmpl_id = :template_id"));
	REQUIRE(contains(query.text, "AND product_id IN (SELECT id FROM templ_products)"));
	REQUIRE(contains(query.text, "AND date::date >= :date_start"));
	REQUIRE(contains(query.text, "AND date::date <= :date_end"));
	REQUIRE(std::get<stockcast::core::Date>(query.params.at("date_end")) == date("2024-03-31"));
	REQUIRE(std::get<std::int64_t>(query.params.at("template_id")) == 5);
	REQUIRE(query.params.count("location_id") == 0);
}

TEST_CASE("SqlQueryBuilder starts the template CTE when no other exists", "[source][sql]") {
	auto request = productAtLocation();
	request.include_children = false;
	request.target = DemandTarget::Template;
	const auto query = SqlQueryBuilder::build(request, 1);
	REQUIRE(query.text.rfind("WITH templ_products AS (", 0) == 0);
}

TEST_CASE("SqlQueryBuilder validates the request", "[source][sql][validation]") {
	auto request = productAtLocation();
	request.location_id.reset();
	REQUIRE_THROWS_AS(SqlQueryBuilder::build(request, 1), InvalidRequest);
}

TEST_CASE("SqlSeriesSource hands the query to its executor", "[source][sql]") {
	std::string seen;
	SqlSeriesSource source(1, [&seen](const SqlQuery &query) {
		seen = query.text;
		return tests::helpers::makeRawBuckets({{"2024-01-01", 2.0}});
	});

	const auto buckets = source.fetch(productAtLocation());
	REQUIRE(buckets.size() == 1);
	REQUIRE(contains(seen, "FROM stock_move"));
	REQUIRE(stockcast::source::toString(stockcast::source::SqlValue {date("2024-02-01")}) == "'2024-02-01'");

	REQUIRE_THROWS_AS(SqlSeriesSource(1, nullptr), std::invalid_argument);
}
