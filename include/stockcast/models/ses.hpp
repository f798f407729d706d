#pragma once

#include "stockcast/models/iforecaster.hpp"
#include "stockcast/utils/logging.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace stockcast::models {

class SimpleExponentialSmoothingBuilder; // Forward declaration

/**
 * @class SimpleExponentialSmoothing
 * @brief A forecasting model that uses a weighted average of past observations,
 *        with the weights decaying exponentially over time.
 *
 * The initial level, and alpha when none is configured, are estimated by
 * minimising the sum of squared one-step-ahead errors with Nelder-Mead.
 * A grid search over alpha supplies the starting point.
 */
class SimpleExponentialSmoothing final : public IForecaster {
public:
	friend class SimpleExponentialSmoothingBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;
	std::string getName() const override {
		return "SimpleExponentialSmoothing";
	}

	/// Smoothing parameter in use; the optimised value after fitting when none was configured.
	double alpha() const {
		return alpha_;
	}
	bool isOptimized() const {
		return !configured_alpha_.has_value();
	}
	double level() const {
		return last_level_;
	}
	/// Estimated level before the first observation.
	double initialLevel() const {
		return initial_level_;
	}
	/// Mean squared one-step-ahead error over the fitted history.
	double mse() const {
		return mse_;
	}

	/// Grid search for the alpha minimising the one-step-ahead MSE of @p data, with the level started at data[0].
	static double optimizeAlpha(const std::vector<double> &data, double *best_mse = nullptr);

private:
	/**
	 * @brief Private constructor for SimpleExponentialSmoothing model.
	 * @param alpha The smoothing parameter for the level, between 0 and 1, or empty to estimate it.
	 */
	explicit SimpleExponentialSmoothing(std::optional<double> alpha);

	std::optional<double> configured_alpha_;
	double alpha_ = 0.5;
	double initial_level_ = 0.0;
	double last_level_ = 0.0;
	double mse_ = 0.0;
	bool is_fitted_ = false;
};

/**
 * @class SimpleExponentialSmoothingBuilder
 * @brief A builder for fluently configuring and creating SimpleExponentialSmoothing models.
 */
class SimpleExponentialSmoothingBuilder {
public:
	/**
	 * @brief Fixes the alpha smoothing parameter instead of estimating it.
	 * @param alpha The smoothing parameter for the level (0 to 1).
	 * @return A reference to the builder for chaining.
	 */
	SimpleExponentialSmoothingBuilder &withAlpha(double alpha);

	/// Estimate alpha from the data during fit (the default).
	SimpleExponentialSmoothingBuilder &withOptimizedAlpha();

	std::unique_ptr<SimpleExponentialSmoothing> build();

private:
	std::optional<double> alpha_;
};

} // namespace stockcast::models
