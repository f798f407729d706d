#include "stockcast/models/holt_winters.hpp"
#include "stockcast/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <utility>
#include <stdexcept>

namespace stockcast::models {

namespace {

void checkUnitInterval(const std::optional<double> &value, const char *name) {
	if (value && (*value < 0.0 || *value > 1.0)) {
		throw std::invalid_argument(std::string(name) + " must be between 0 and 1.");
	}
}

constexpr double kLevelShiftBound = 10.0;

} // namespace

HoltWinters::HoltWinters(HoltWintersConfig config) : config_(std::move(config)) {
	checkUnitInterval(config_.alpha, "Alpha");
	checkUnitInterval(config_.beta, "Beta");
	checkUnitInterval(config_.gamma, "Gamma");
	if (hasSeason() && config_.seasonal_period < 2) {
		throw std::invalid_argument("Seasonal period must be >= 2 for a seasonal Holt-Winters model.");
	}
}

HoltWinters::State HoltWinters::initialState(const std::vector<double> &values) const {
	State state;
	if (hasSeason()) {
		const auto m = static_cast<std::size_t>(config_.seasonal_period);
		const double first_mean = std::accumulate(values.begin(), values.begin() + m, 0.0) / static_cast<double>(m);
		const double second_mean =
		    std::accumulate(values.begin() + m, values.begin() + 2 * m, 0.0) / static_cast<double>(m);
		state.level = first_mean;
		state.trend = hasTrend() ? (second_mean - first_mean) / static_cast<double>(m) : 0.0;
		state.seasonals.reserve(m);
		for (std::size_t i = 0; i < m; ++i) {
			state.seasonals.push_back(values[i] - first_mean);
		}
	} else {
		state.level = values.front();
		state.trend = hasTrend() ? values[1] - values[0] : 0.0;
	}
	return state;
}

double HoltWinters::smooth(const std::vector<double> &values, double alpha, double beta, double gamma,
                           State &state) const {
	const std::size_t m = state.seasonals.size();
	double sse = 0.0;
	for (std::size_t t = 0; t < values.size(); ++t) {
		const double season = m > 0 ? state.seasonals[t % m] : 0.0;
		const double previous_level = state.level;
		const double previous_trend = state.trend;
		const double fitted = previous_level + previous_trend + season;
		const double error = values[t] - fitted;
		sse += error * error;

		state.level = alpha * (values[t] - season) + (1.0 - alpha) * (previous_level + previous_trend);
		if (hasTrend()) {
			state.trend = beta * (state.level - previous_level) + (1.0 - beta) * previous_trend;
		}
		if (m > 0) {
			state.seasonals[t % m] =
			    gamma * (values[t] - previous_level - previous_trend) + (1.0 - gamma) * season;
		}
	}
	return sse;
}

void HoltWinters::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	if (values.empty()) {
		throw std::invalid_argument("Time series cannot be empty for fitting.");
	}
	if (hasTrend() && values.size() < 2) {
		throw std::invalid_argument("Holt-Winters with trend needs at least 2 observations.");
	}
	if (hasSeason() && values.size() < 2 * static_cast<std::size_t>(config_.seasonal_period)) {
		throw std::invalid_argument("Holt-Winters with season needs at least two full seasonal cycles.");
	}
	for (double value : values) {
		if (!std::isfinite(value)) {
			throw std::invalid_argument("Holt-Winters cannot fit non-finite observations.");
		}
	}

	const State initial = initialState(values);
	double scale = 0.0;
	for (double value : values) {
		scale = std::max(scale, std::abs(value));
	}
	if (scale == 0.0) {
		scale = 1.0;
	}

	// Free parameters: [alpha, beta?, gamma?, level shift in units of scale].
	std::vector<double> start;
	std::vector<double> lower;
	std::vector<double> upper;
	auto addFree = [&](const std::optional<double> &fixed, double guess) {
		if (!fixed) {
			start.push_back(guess);
			lower.push_back(0.0);
			upper.push_back(1.0);
		}
	};
	addFree(config_.alpha, 0.5);
	if (hasTrend()) {
		addFree(config_.beta, 0.1);
	}
	if (hasSeason()) {
		addFree(config_.gamma, 0.1);
	}
	start.push_back(0.0);
	lower.push_back(-kLevelShiftBound);
	upper.push_back(kLevelShiftBound);

	auto unpack = [&](const std::vector<double> &params, double &alpha, double &beta, double &gamma, State &state) {
		std::size_t idx = 0;
		alpha = config_.alpha ? *config_.alpha : params[idx++];
		beta = hasTrend() ? (config_.beta ? *config_.beta : params[idx++]) : 0.0;
		gamma = hasSeason() ? (config_.gamma ? *config_.gamma : params[idx++]) : 0.0;
		state = initial;
		state.level += params[idx] * scale;
	};

	auto objective = [&](const std::vector<double> &params) {
		double alpha = 0.0;
		double beta = 0.0;
		double gamma = 0.0;
		State state;
		unpack(params, alpha, beta, gamma, state);
		return smooth(values, alpha, beta, gamma, state);
	};

	utils::NelderMeadOptimizer optimizer;
	utils::NelderMeadOptimizer::Options options;
	options.max_iterations = 1000;
	const auto result = optimizer.minimize(objective, start, options, lower, upper);
	if (result.best.empty() || !std::isfinite(result.value)) {
		throw std::runtime_error("Holt-Winters parameter optimisation did not produce a finite fit.");
	}
	if (!result.converged) {
		STOCKCAST_DEBUG("Holt-Winters optimisation stopped after {} iterations without converging.",
		                result.iterations);
	}

	State state;
	unpack(result.best, alpha_, beta_, gamma_, state);
	sse_ = smooth(values, alpha_, beta_, gamma_, state);
	level_ = state.level;
	trend_ = state.trend;
	seasonals_ = std::move(state.seasonals);
	observations_ = values.size();
	is_fitted_ = true;

	STOCKCAST_INFO("HoltWinters model fitted with {} data points: alpha={:.3f}, beta={:.3f}, gamma={:.3f}, SSE={:.4f}",
	               values.size(), alpha_, beta_, gamma_, sse_);
}

core::Forecast HoltWinters::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("HoltWinters::predict called before fit.");
	}
	if (horizon <= 0) {
		return {};
	}

	core::Forecast forecast;
	auto &series = forecast.primary();
	series.reserve(static_cast<std::size_t>(horizon));
	const std::size_t m = seasonals_.size();
	for (int h = 1; h <= horizon; ++h) {
		double value = level_ + static_cast<double>(h) * trend_;
		if (m > 0) {
			value += seasonals_[(observations_ + static_cast<std::size_t>(h) - 1) % m];
		}
		series.push_back(value);
	}
	return forecast;
}

} // namespace stockcast::models
