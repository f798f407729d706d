#pragma once

#include "stockcast/core/forecast.hpp"
#include "stockcast/core/time_series.hpp"

#include <string>

namespace stockcast::models {

/**
 * @class IForecaster
 * @brief An interface for all forecasting models.
 *
 * A model is fitted once on the complete demand history and then asked for
 * the buckets that immediately follow it. Implementations throw
 * std::invalid_argument when the history cannot support the configured model
 * and std::runtime_error when prediction is requested before a fit.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The time series data to train the model on.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Generates forecasts for a specified number of steps into the future.
	 * @param horizon The number of future time steps to predict.
	 * @return A Forecast object containing the point predictions.
	 */
	virtual core::Forecast predict(int horizon) = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 */
	virtual std::string getName() const = 0;
};

} // namespace stockcast::models
