#pragma once

#include "stockcast/source/series_source.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>

namespace stockcast::source {

using SqlValue = std::variant<std::int64_t, core::Date, std::string>;

/**
 * @struct SqlQuery
 * @brief Query text with named placeholders (":name") and their bound values.
 */
struct SqlQuery {
	std::string text;
	std::map<std::string, SqlValue> params;
};

/// Renders a bound value for logging.
std::string toString(const SqlValue &value);

/**
 * @class SqlQueryBuilder
 * @brief Builds the demand query over the stock_move table of an Odoo-style schema.
 *
 * The query returns one row per truncated date (`date_gr`, `qty`) holding
 * the summed quantity of done moves leaving the requested locations.
 */
class SqlQueryBuilder {
public:
	/**
	 * @throws InvalidRequest If @p request fails validation.
	 */
	static SqlQuery build(const pipeline::ForecastRequest &request, std::int64_t company_id);
};

/**
 * @class SqlSeriesSource
 * @brief ISeriesSource that runs the built query through a caller supplied executor.
 */
class SqlSeriesSource final : public ISeriesSource {
public:
	using Executor = std::function<std::vector<core::RawBucket>(const SqlQuery &)>;

	SqlSeriesSource(std::int64_t company_id, Executor executor);

	std::vector<core::RawBucket> fetch(const pipeline::ForecastRequest &request) override;

private:
	std::int64_t company_id_;
	Executor executor_;
};

} // namespace stockcast::source
