#pragma once

#include "stockcast/source/series_source.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace stockcast::source {

struct Location {
	std::int64_t id = 0;
	std::optional<std::int64_t> parent_id;
	std::int64_t company_id = 0;
	bool internal = true;
};

enum class MoveState {
	Draft,
	Waiting,
	Confirmed,
	Assigned,
	Done,
	Cancel
};

struct StockMove {
	std::int64_t product_id = 0;
	std::int64_t company_id = 0;
	std::int64_t location_id = 0;
	std::int64_t location_dest_id = 0;
	core::Date date;
	double quantity = 0.0;
	MoveState state = MoveState::Done;
};

/**
 * @class MoveLedger
 * @brief In-memory stock moves and locations answering demand requests.
 *
 * Applies the same selection as the SQL demand query: done moves of the
 * company leaving the requested location set, for one product or every
 * variant of a template, inside the optional date range. Quantities are
 * summed per truncated date.
 */
class MoveLedger final : public ISeriesSource {
public:
	explicit MoveLedger(std::int64_t company_id);

	void addLocation(const Location &location);
	/// Registers @p product_id as a variant of @p template_id.
	void addProduct(std::int64_t product_id, std::int64_t template_id);
	void addMove(const StockMove &move);

	std::vector<core::RawBucket> fetch(const pipeline::ForecastRequest &request) override;

	/// Location ids counted as "inside" for a request; moves must leave this set.
	std::set<std::int64_t> sourceLocations(const pipeline::ForecastRequest &request) const;

	std::size_t moveCount() const {
		return moves_.size();
	}

private:
	std::set<std::int64_t> childLocations(std::int64_t root) const;
	std::set<std::int64_t> internalLocations() const;
	std::set<std::int64_t> targetProducts(const pipeline::ForecastRequest &request) const;

	std::int64_t company_id_;
	std::map<std::int64_t, Location> locations_;
	std::map<std::int64_t, std::int64_t> product_templates_;
	std::vector<StockMove> moves_;
};

} // namespace stockcast::source
