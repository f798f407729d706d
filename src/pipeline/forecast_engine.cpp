#include "stockcast/pipeline/forecast_engine.hpp"
#include "stockcast/pipeline/defaults.hpp"
#include "stockcast/pipeline/model_factory.hpp"
#include "stockcast/utils/logging.hpp"

#include <cmath>
#include <stdexcept>

namespace stockcast::pipeline {

double ForecastEngine::sanitize(double value) {
	if (!(value > 0.0)) {
		return 0.0;
	}
	const double rounded = std::round(value * 100.0) / 100.0;
	return rounded > 0.0 ? rounded : 0.0;
}

core::ForecastOutcome ForecastEngine::forecast(const core::TimeSeries &history, const ForecastParameters &params,
                                               int periods) const {
	if (history.empty()) {
		STOCKCAST_WARN("Cannot forecast an empty demand series.");
		return std::nullopt;
	}
	const int horizon = pinnedPeriods(params.method, periods);
	if (horizon <= 0) {
		STOCKCAST_WARN("Forecast horizon must be positive, got {}.", horizon);
		return std::nullopt;
	}

	core::Forecast prediction;
	std::string model_name = toString(params.method);
	try {
		auto model = ModelFactory::create(params);
		model_name = model->getName();
		model->fit(history);
		prediction = model->predict(horizon);
		if (prediction.horizon() != static_cast<std::size_t>(horizon)) {
			throw std::runtime_error("Model returned " + std::to_string(prediction.horizon()) + " values for " +
			                         std::to_string(horizon) + " requested periods.");
		}
		for (double value : prediction.primary()) {
			if (!std::isfinite(value)) {
				throw std::runtime_error("Model produced a non-finite forecast value.");
			}
		}
	} catch (const std::exception &e) {
		STOCKCAST_WARN("The data is not sufficient to make a {} prediction. Error: {}", model_name, e.what());
		return std::nullopt;
	}

	core::ForecastSeries series;
	series.reserve(prediction.horizon());
	const auto &values = prediction.primary();
	for (std::size_t i = 0; i < values.size(); ++i) {
		series.push_back(core::ForecastPoint {history.bucketAfterEnd(i + 1), sanitize(values[i])});
	}
	STOCKCAST_DEBUG("{} forecast {} bucket(s) after {}", model_name, series.size(), history.back().toString());
	return series;
}

} // namespace stockcast::pipeline
