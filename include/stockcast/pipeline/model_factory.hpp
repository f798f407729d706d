#pragma once

#include "stockcast/models/iforecaster.hpp"
#include "stockcast/pipeline/request.hpp"

#include <memory>

namespace stockcast::pipeline {

class ModelFactory {
public:
	/**
	 * @brief Creates an unfitted forecaster for the method in @p params.
	 * @throws std::invalid_argument If the hyperparameters are rejected by the model.
	 */
	static std::unique_ptr<models::IForecaster> create(const ForecastParameters &params);
};

} // namespace stockcast::pipeline
