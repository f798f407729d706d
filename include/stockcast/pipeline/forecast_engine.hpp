#pragma once

#include "stockcast/core/demand.hpp"
#include "stockcast/core/time_series.hpp"
#include "stockcast/pipeline/request.hpp"

namespace stockcast::pipeline {

/**
 * @class ForecastEngine
 * @brief Fits the requested model on a normalized series and predicts the following buckets.
 *
 * Model failures never escape: they are logged as warnings and reported as
 * an empty outcome so the caller can still show the history.
 */
class ForecastEngine {
public:
	/**
	 * @brief Forecasts @p periods buckets after the end of @p history.
	 *
	 * HWES and SES always produce a single bucket. Values are clamped to be
	 * non-negative and rounded to two decimals.
	 * @return The forecast, or std::nullopt if the model could not be fitted.
	 */
	core::ForecastOutcome forecast(const core::TimeSeries &history, const ForecastParameters &params,
	                               int periods) const;

	/// Clamps @p value to zero from below and rounds it to two decimals.
	static double sanitize(double value);
};

} // namespace stockcast::pipeline
