#include "stockcast/source/sql_query.hpp"
#include "stockcast/utils/logging.hpp"

#include <sstream>
#include <stdexcept>

namespace stockcast::source {

std::string toString(const SqlValue &value) {
	if (const auto *number = std::get_if<std::int64_t>(&value)) {
		return std::to_string(*number);
	}
	if (const auto *date = std::get_if<core::Date>(&value)) {
		return "'" + date->toString() + "'";
	}
	return "'" + std::get<std::string>(value) + "'";
}

SqlQuery SqlQueryBuilder::build(const pipeline::ForecastRequest &request, std::int64_t company_id) {
	request.validate();

	SqlQuery query;
	query.params["interval"] = core::toString(request.interval);
	query.params["company_id"] = company_id;

	std::ostringstream with_clause;
	std::ostringstream where_clause;
	bool has_with = false;

	if (request.scope == pipeline::DemandScope::Location) {
		query.params["location_id"] = *request.location_id;
		if (request.include_children) {
			with_clause << R"(WITH RECURSIVE child_locs AS (
    SELECT id, location_id
    FROM stock_location
    WHERE (location_id = :location_id OR id = :location_id) AND usage = 'internal'
    UNION
    SELECT stock_location.id, stock_location.location_id
    FROM stock_location
        JOIN child_locs ON stock_location.location_id = child_locs.id
))";
			has_with = true;
			where_clause << R"(
    AND location_id IN (SELECT id FROM child_locs)
    AND location_dest_id NOT IN (SELECT id FROM child_locs))";
		} else {
			where_clause << R"(
    AND location_id = :location_id)";
		}
	} else {
		with_clause << R"(WITH internal_locations AS (
    SELECT id
    FROM stock_location
    WHERE company_id = :company_id AND usage = 'internal'
))";
		has_with = true;
		where_clause << R"(
    AND location_id IN (SELECT id FROM internal_locations)
    AND location_dest_id NOT IN (SELECT id FROM internal_locations))";
	}

	if (request.target == pipeline::DemandTarget::Product) {
		query.params["product_id"] = request.target_id;
		where_clause << R"(
    AND product_id = :product_id)";
	} else {
		query.params["template_id"] = request.target_id;
		with_clause << (has_with ? ",\n" : "WITH ") << R"(templ_products AS (
    SELECT id
    FROM product_product
    WHERE product_tmpl_id = :template_id
))";
		has_with = true;
		where_clause << R"(
    AND product_id IN (SELECT id FROM templ_products))";
	}

	if (request.date_start) {
		query.params["date_start"] = *request.date_start;
		where_clause << R"(
    AND date::date >= :date_start)";
	}
	if (request.date_end) {
		query.params["date_end"] = *request.date_end;
		where_clause << R"(
    AND date::date <= :date_end)";
	}

	std::ostringstream sql;
	if (has_with) {
		sql << with_clause.str() << "\n";
	}
	sql << R"(SELECT
    DATE_TRUNC(:interval, date) AS date_gr,
    SUM(product_qty) AS qty
FROM stock_move
WHERE
    state = 'done'
    AND company_id = :company_id)"
	    << where_clause.str() << R"(
GROUP BY date_gr
ORDER BY date_gr)";
	query.text = sql.str();
	return query;
}

SqlSeriesSource::SqlSeriesSource(std::int64_t company_id, Executor executor)
    : company_id_(company_id), executor_(std::move(executor)) {
	if (!executor_) {
		throw std::invalid_argument("SqlSeriesSource requires a query executor.");
	}
}

std::vector<core::RawBucket> SqlSeriesSource::fetch(const pipeline::ForecastRequest &request) {
	const auto query = SqlQueryBuilder::build(request, company_id_);
	STOCKCAST_TRACE("Demand query:\n{}", query.text);
	for (const auto &[name, value] : query.params) {
		STOCKCAST_TRACE("  :{} = {}", name, toString(value));
	}
	return executor_(query);
}

} // namespace stockcast::source
