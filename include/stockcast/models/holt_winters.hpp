#pragma once

#include "stockcast/models/iforecaster.hpp"
#include "stockcast/utils/logging.hpp"

#include <optional>
#include <string>
#include <vector>

namespace stockcast::models {

enum class HoltWintersTrend {
	None,
	Additive
};

enum class HoltWintersSeason {
	None,
	Additive
};

/**
 * @brief Configuration of a Holt-Winters exponential smoothing model.
 *
 * Unset smoothing parameters are estimated together with the initial level
 * by minimising the one-step-ahead squared error.
 */
struct HoltWintersConfig {
	HoltWintersTrend trend = HoltWintersTrend::None;
	HoltWintersSeason season = HoltWintersSeason::None;
	int seasonal_period = 0;
	std::optional<double> alpha;
	std::optional<double> beta;
	std::optional<double> gamma;
};

/**
 * @class HoltWinters
 * @brief Holt-Winters exponential smoothing with optional additive trend and season.
 *
 * Level:  l_t = alpha * (y_t - s_{t-m}) + (1 - alpha) * (l_{t-1} + b_{t-1})
 * Trend:  b_t = beta * (l_t - l_{t-1}) + (1 - beta) * b_{t-1}
 * Season: s_t = gamma * (y_t - l_{t-1} - b_{t-1}) + (1 - gamma) * s_{t-m}
 *
 * With neither trend nor season this is simple exponential smoothing with an
 * estimated initial level.
 */
class HoltWinters final : public IForecaster {
public:
	explicit HoltWinters(HoltWintersConfig config = {});

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "HoltWinters";
	}

	double alpha() const {
		return alpha_;
	}
	double beta() const {
		return beta_;
	}
	double gamma() const {
		return gamma_;
	}
	double level() const {
		return level_;
	}
	double trend() const {
		return trend_;
	}
	double sse() const {
		return sse_;
	}
	const HoltWintersConfig &config() const {
		return config_;
	}

private:
	struct State {
		double level = 0.0;
		double trend = 0.0;
		std::vector<double> seasonals;
	};

	bool hasTrend() const {
		return config_.trend == HoltWintersTrend::Additive;
	}
	bool hasSeason() const {
		return config_.season == HoltWintersSeason::Additive;
	}
	State initialState(const std::vector<double> &values) const;
	// Runs the recursions over @p values, updating @p state in place; returns the SSE.
	double smooth(const std::vector<double> &values, double alpha, double beta, double gamma, State &state) const;

	HoltWintersConfig config_;
	double alpha_ = 0.0;
	double beta_ = 0.0;
	double gamma_ = 0.0;
	double level_ = 0.0;
	double trend_ = 0.0;
	std::vector<double> seasonals_;
	std::size_t observations_ = 0;
	double sse_ = 0.0;
	bool is_fitted_ = false;
};

} // namespace stockcast::models
