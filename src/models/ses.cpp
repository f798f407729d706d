#include "stockcast/models/ses.hpp"

#include "stockcast/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace stockcast::models {

namespace {
	constexpr int kAlphaGridSteps = 99; // alpha = 0.01 .. 0.99
	constexpr double kAlphaGridStep = 0.01;
	constexpr double kFallbackAlpha = 0.5;
	constexpr double kLevelShiftBound = 1.0; // in units of max |y|

	double oneStepMse(const std::vector<double> &data, double alpha) {
		double level = data[0];
		double sse = 0.0;
		for (std::size_t i = 1; i < data.size(); ++i) {
			const double error = data[i] - level;
			sse += error * error;
			level = alpha * data[i] + (1.0 - alpha) * level;
		}
		return sse / static_cast<double>(data.size() - 1);
	}

	// Sum of squared one-step errors including the first observation; leaves the final level in @p level.
	double smooth(const std::vector<double> &data, double alpha, double initial_level, double &level) {
		level = initial_level;
		double sse = 0.0;
		for (double value : data) {
			const double error = value - level;
			sse += error * error;
			level = alpha * value + (1.0 - alpha) * level;
		}
		return sse;
	}
} // namespace

SimpleExponentialSmoothing::SimpleExponentialSmoothing(std::optional<double> alpha) : configured_alpha_(alpha) {
	if (configured_alpha_ && (*configured_alpha_ < 0.0 || *configured_alpha_ > 1.0)) {
		throw std::invalid_argument("Alpha must be between 0 and 1.");
	}
	alpha_ = configured_alpha_.value_or(kFallbackAlpha);
}

double SimpleExponentialSmoothing::optimizeAlpha(const std::vector<double> &data, double *best_mse) {
	if (data.size() < 2) {
		if (best_mse) {
			*best_mse = 0.0;
		}
		return kFallbackAlpha;
	}

	double best_alpha = kFallbackAlpha;
	double lowest = std::numeric_limits<double>::infinity();
	for (int step = 1; step <= kAlphaGridSteps; ++step) {
		const double alpha = step * kAlphaGridStep;
		const double mse = oneStepMse(data, alpha);
		if (mse < lowest) {
			lowest = mse;
			best_alpha = alpha;
		}
	}
	if (best_mse) {
		*best_mse = lowest;
	}
	STOCKCAST_DEBUG("SES alpha search: alpha={:.2f}, MSE={:.4f}", best_alpha, lowest);
	return best_alpha;
}

void SimpleExponentialSmoothing::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	if (values.empty()) {
		throw std::invalid_argument("Time series cannot be empty for fitting.");
	}
	for (double value : values) {
		if (!std::isfinite(value)) {
			throw std::invalid_argument("SimpleExponentialSmoothing cannot fit non-finite observations.");
		}
	}

	double scale = 0.0;
	for (double value : values) {
		scale = std::max(scale, std::abs(value));
	}
	if (scale == 0.0) {
		scale = 1.0;
	}

	// Free parameters: [alpha?, level shift in units of scale].
	std::vector<double> start;
	std::vector<double> lower;
	std::vector<double> upper;
	if (!configured_alpha_) {
		start.push_back(optimizeAlpha(values));
		lower.push_back(0.0);
		upper.push_back(1.0);
	}
	start.push_back(0.0);
	lower.push_back(-kLevelShiftBound);
	upper.push_back(kLevelShiftBound);

	auto unpack = [&](const std::vector<double> &params, double &alpha, double &level) {
		std::size_t idx = 0;
		alpha = configured_alpha_ ? *configured_alpha_ : params[idx++];
		level = values[0] + params[idx] * scale;
	};

	auto objective = [&](const std::vector<double> &params) {
		double alpha = 0.0;
		double level = 0.0;
		unpack(params, alpha, level);
		double final_level = 0.0;
		return smooth(values, alpha, level, final_level);
	};

	utils::NelderMeadOptimizer optimizer;
	utils::NelderMeadOptimizer::Options options;
	options.max_iterations = 1000;
	const auto result = optimizer.minimize(objective, start, options, lower, upper);
	if (result.best.empty() || !std::isfinite(result.value)) {
		throw std::runtime_error("SES parameter optimisation did not produce a finite fit.");
	}
	if (!result.converged) {
		STOCKCAST_DEBUG("SES optimisation stopped after {} iterations without converging.", result.iterations);
	}

	unpack(result.best, alpha_, initial_level_);
	mse_ = smooth(values, alpha_, initial_level_, last_level_) / static_cast<double>(values.size());

	is_fitted_ = true;
	STOCKCAST_INFO("SES model fitted with {} data points. alpha = {:.3f}, initial level = {}, final level = {}.",
	               values.size(), alpha_, initial_level_, last_level_);
}

core::Forecast SimpleExponentialSmoothing::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon < 0) {
		throw std::invalid_argument("Forecast horizon must be non-negative.");
	}
	if (horizon == 0) {
		return {};
	}

	// Every future bucket carries the last smoothed level.
	core::Forecast forecast;
	forecast.primary().assign(static_cast<std::size_t>(horizon), last_level_);
	return forecast;
}

SimpleExponentialSmoothingBuilder &SimpleExponentialSmoothingBuilder::withAlpha(double alpha) {
	alpha_ = alpha;
	return *this;
}

SimpleExponentialSmoothingBuilder &SimpleExponentialSmoothingBuilder::withOptimizedAlpha() {
	alpha_.reset();
	return *this;
}

std::unique_ptr<SimpleExponentialSmoothing> SimpleExponentialSmoothingBuilder::build() {
	if (alpha_) {
		STOCKCAST_DEBUG("Building SES model with alpha = {}.", *alpha_);
	} else {
		STOCKCAST_DEBUG("Building SES model with estimated alpha.");
	}
	return std::unique_ptr<SimpleExponentialSmoothing>(new SimpleExponentialSmoothing(alpha_));
}

} // namespace stockcast::models
