#include "stockcast/source/move_ledger.hpp"
#include "stockcast/utils/logging.hpp"

#include <stdexcept>

namespace stockcast::source {

MoveLedger::MoveLedger(std::int64_t company_id) : company_id_(company_id) {
}

void MoveLedger::addLocation(const Location &location) {
	if (!locations_.emplace(location.id, location).second) {
		throw std::invalid_argument("Duplicate location id " + std::to_string(location.id) + ".");
	}
}

void MoveLedger::addProduct(std::int64_t product_id, std::int64_t template_id) {
	product_templates_[product_id] = template_id;
}

void MoveLedger::addMove(const StockMove &move) {
	moves_.push_back(move);
}

std::set<std::int64_t> MoveLedger::childLocations(std::int64_t root) const {
	// Seed: the root and its direct children, restricted to internal locations.
	std::set<std::int64_t> result;
	for (const auto &[id, location] : locations_) {
		if (location.internal && (id == root || location.parent_id == root)) {
			result.insert(id);
		}
	}
	// Then any descendant of the seed, whatever its usage.
	bool grown = true;
	while (grown) {
		grown = false;
		for (const auto &[id, location] : locations_) {
			if (location.parent_id && result.count(*location.parent_id) > 0 && result.insert(id).second) {
				grown = true;
			}
		}
	}
	return result;
}

std::set<std::int64_t> MoveLedger::internalLocations() const {
	std::set<std::int64_t> result;
	for (const auto &[id, location] : locations_) {
		if (location.internal && location.company_id == company_id_) {
			result.insert(id);
		}
	}
	return result;
}

std::set<std::int64_t> MoveLedger::sourceLocations(const pipeline::ForecastRequest &request) const {
	if (request.scope == pipeline::DemandScope::Company) {
		return internalLocations();
	}
	if (!request.location_id) {
		throw InvalidRequest("Location demand requires a location.");
	}
	if (request.include_children) {
		return childLocations(*request.location_id);
	}
	return {*request.location_id};
}

std::set<std::int64_t> MoveLedger::targetProducts(const pipeline::ForecastRequest &request) const {
	if (request.target == pipeline::DemandTarget::Product) {
		return {request.target_id};
	}
	std::set<std::int64_t> result;
	for (const auto &[product, templ] : product_templates_) {
		if (templ == request.target_id) {
			result.insert(product);
		}
	}
	return result;
}

std::vector<core::RawBucket> MoveLedger::fetch(const pipeline::ForecastRequest &request) {
	request.validate();

	const auto sources = sourceLocations(request);
	const auto products = targetProducts(request);
	// Without children only the source location is checked, so internal transfers count.
	const bool check_destination =
	    request.scope == pipeline::DemandScope::Company || request.include_children;

	std::map<core::Date, double> totals;
	for (const auto &move : moves_) {
		if (move.state != MoveState::Done || move.company_id != company_id_) {
			continue;
		}
		if (sources.count(move.location_id) == 0) {
			continue;
		}
		if (check_destination && sources.count(move.location_dest_id) > 0) {
			continue;
		}
		if (products.count(move.product_id) == 0) {
			continue;
		}
		if ((request.date_start && move.date < *request.date_start) ||
		    (request.date_end && move.date > *request.date_end)) {
			continue;
		}
		totals[core::truncate(move.date, request.interval)] += move.quantity;
	}

	std::vector<core::RawBucket> buckets;
	buckets.reserve(totals.size());
	for (const auto &[bucket, quantity] : totals) {
		buckets.push_back(core::RawBucket {bucket, quantity});
	}
	STOCKCAST_DEBUG("Ledger matched {} bucket(s) from {} move(s)", buckets.size(), moves_.size());
	return buckets;
}

} // namespace stockcast::source
