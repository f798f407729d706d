#include "stockcast/pipeline/demand_pipeline.hpp"
#include "stockcast/pipeline/assembler.hpp"
#include "stockcast/pipeline/normalizer.hpp"
#include "stockcast/utils/logging.hpp"

namespace stockcast::pipeline {

DemandPipeline::DemandPipeline(source::ISeriesSource &source, ForecastEngine engine)
    : source_(source), engine_(engine) {
}

DemandComputation DemandPipeline::compute(const ForecastRequest &request) const {
	request.validate();

	auto raw = source_.fetch(request);
	STOCKCAST_DEBUG("Fetched {} raw buckets for target {}", raw.size(), request.target_id);

	DemandComputation result;
	auto history = normalizeSeries(std::move(raw), request.interval, request.date_start, request.date_end);
	if (!history) {
		STOCKCAST_INFO("No stock operations for target {} in the requested period.", request.target_id);
		result.status = ComputationStatus::NoData;
		return result;
	}

	const auto forecast = engine_.forecast(*history, request.parameters, request.predicted_periods);
	result.status = ComputationStatus::Ok;
	result.forecast_available = forecast.has_value();
	result.records = assembleDemand(*history, forecast);
	return result;
}

} // namespace stockcast::pipeline
