#pragma once

#include "stockcast/core/demand.hpp"
#include "stockcast/pipeline/forecast_engine.hpp"
#include "stockcast/pipeline/request.hpp"
#include "stockcast/source/series_source.hpp"

#include <vector>

namespace stockcast::pipeline {

enum class ComputationStatus {
	Ok,
	NoData
};

/**
 * @struct DemandComputation
 * @brief Outcome of one request: the ascending records or a no-data status.
 */
struct DemandComputation {
	ComputationStatus status = ComputationStatus::NoData;
	std::vector<core::DemandRecord> records;
	bool forecast_available = false;

	bool hasData() const {
		return status == ComputationStatus::Ok;
	}
};

/**
 * @class DemandPipeline
 * @brief Fetches, normalizes, forecasts and assembles the demand of one request.
 *
 * The pipeline keeps no state between calls; running the same request
 * against unchanged data yields the same records.
 */
class DemandPipeline {
public:
	explicit DemandPipeline(source::ISeriesSource &source, ForecastEngine engine = {});

	/**
	 * @throws InvalidRequest If @p request fails validation; nothing is fetched then.
	 */
	DemandComputation compute(const ForecastRequest &request) const;

private:
	source::ISeriesSource &source_;
	ForecastEngine engine_;
};

} // namespace stockcast::pipeline
