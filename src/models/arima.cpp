#include "stockcast/models/arima.hpp"
#include "stockcast/utils/least_squares.hpp"
#include "stockcast/utils/nelder_mead.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace stockcast::models {

namespace {

constexpr double kMaBound = 0.99;

} // namespace

ARIMA::ARIMA(int p, int d, int q, int P, int D, int Q, int s, std::optional<bool> include_intercept)
    : p_(p), d_(d), q_(q), P_(P), D_(D), Q_(Q), seasonal_period_(s) {
	if (p < 0 || d < 0 || q < 0) {
		throw std::invalid_argument("ARIMA orders (p, d, q) must be non-negative.");
	}
	if (P < 0 || D < 0 || Q < 0) {
		throw std::invalid_argument("Seasonal ARIMA orders (P, D, Q) must be non-negative.");
	}
	if (seasonal_period_ < 0) {
		throw std::invalid_argument("Seasonal period must be non-negative.");
	}
	if ((P > 0 || Q > 0 || D > 0) && seasonal_period_ < 2) {
		throw std::invalid_argument("Seasonal period must be >= 2 for seasonal ARIMA components.");
	}
	include_intercept_ = include_intercept.value_or(d_ == 0 && D_ == 0);
}

std::size_t ARIMA::minimumObservations() const {
	const int differenced = d_ + D_ * seasonal_period_;
	const int regressors = p_ + P_ + (include_intercept_ ? 1 : 0);
	return static_cast<std::size_t>(maxLag() + differenced + std::max(1, regressors));
}

int ARIMA::maxLag() const {
	const int seasonal_lag = seasonal_period_ > 1 ? std::max(P_, Q_) * seasonal_period_ : 0;
	return std::max({p_, q_, seasonal_lag});
}

std::vector<double> ARIMA::difference(const std::vector<double> &data, int d) {
	if (d == 0) {
		return data;
	}
	if (data.size() <= static_cast<std::size_t>(d)) {
		throw std::invalid_argument("Insufficient data length for requested differencing order.");
	}

	std::vector<double> result = data;
	for (int order = 0; order < d; ++order) {
		for (std::size_t i = result.size() - 1; i > 0; --i) {
			result[i] -= result[i - 1];
		}
		result.erase(result.begin());
	}
	return result;
}

std::vector<double> ARIMA::seasonalDifference(const std::vector<double> &data, int D, int s) {
	if (D == 0 || s <= 1) {
		return data;
	}
	if (data.size() <= static_cast<std::size_t>(D * s)) {
		throw std::invalid_argument("Insufficient data length for requested seasonal differencing order.");
	}

	const std::size_t lag = static_cast<std::size_t>(s);
	std::vector<double> result = data;
	for (int order = 0; order < D; ++order) {
		std::vector<double> next;
		next.reserve(result.size() - lag);
		for (std::size_t i = lag; i < result.size(); ++i) {
			next.push_back(result[i] - result[i - lag]);
		}
		result = std::move(next);
	}
	return result;
}

double ARIMA::logLikelihood(const std::vector<double> &residuals) {
	if (residuals.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	double sum_sq = 0.0;
	for (double r : residuals) {
		sum_sq += r * r;
	}
	const double sigma2 = sum_sq / static_cast<double>(residuals.size());
	if (sigma2 <= 0.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return -0.5 * static_cast<double>(residuals.size()) * (std::log(2.0 * M_PI * sigma2) + 1.0);
}

double ARIMA::predictStep(const std::vector<double> &series, const std::vector<double> &residuals,
                          std::size_t t) const {
	double prediction = intercept_;
	for (int i = 0; i < p_; ++i) {
		if (t > static_cast<std::size_t>(i)) {
			prediction += ar_coeffs_[i] * series[t - static_cast<std::size_t>(i) - 1];
		}
	}
	for (int i = 0; i < seasonal_ar_coeffs_.size(); ++i) {
		const std::size_t lag = static_cast<std::size_t>((i + 1) * seasonal_period_);
		if (t >= lag) {
			prediction += seasonal_ar_coeffs_[i] * series[t - lag];
		}
	}
	for (int i = 0; i < q_; ++i) {
		if (t > static_cast<std::size_t>(i)) {
			prediction += ma_coeffs_[i] * residuals[t - static_cast<std::size_t>(i) - 1];
		}
	}
	for (int i = 0; i < seasonal_ma_coeffs_.size(); ++i) {
		const std::size_t lag = static_cast<std::size_t>((i + 1) * seasonal_period_);
		if (t >= lag) {
			prediction += seasonal_ma_coeffs_[i] * residuals[t - lag];
		}
	}
	return prediction;
}

void ARIMA::computeResiduals() {
	const std::size_t start = static_cast<std::size_t>(maxLag());
	for (std::size_t t = start; t < differenced_history_.size(); ++t) {
		residuals_[t] = differenced_history_[t] - predictStep(differenced_history_, residuals_, t);
	}
}

double ARIMA::conditionalSumOfSquares() {
	residuals_.assign(differenced_history_.size(), 0.0);
	computeResiduals();
	double sse = 0.0;
	for (std::size_t t = static_cast<std::size_t>(maxLag()); t < residuals_.size(); ++t) {
		sse += residuals_[t] * residuals_[t];
	}
	return sse;
}

void ARIMA::estimateAutoregressive() {
	const auto &series = differenced_history_;
	const int n = static_cast<int>(series.size());
	const int start = std::max(p_, P_ * seasonal_period_);
	const int params = p_ + P_ + (include_intercept_ ? 1 : 0);

	intercept_ = 0.0;
	ar_coeffs_ = Eigen::VectorXd::Zero(p_);
	seasonal_ar_coeffs_ = Eigen::VectorXd::Zero(P_);
	if (params == 0) {
		return;
	}
	const int rows = n - start;
	if (rows < params) {
		throw std::invalid_argument("Not enough data to estimate AR parameters.");
	}

	Eigen::MatrixXd design(rows, params);
	Eigen::VectorXd response(rows);
	for (int row = 0; row < rows; ++row) {
		const int t = row + start;
		int col = 0;
		if (include_intercept_) {
			design(row, col++) = 1.0;
		}
		for (int i = 1; i <= p_; ++i) {
			design(row, col++) = series[t - i];
		}
		for (int j = 1; j <= P_; ++j) {
			design(row, col++) = series[t - j * seasonal_period_];
		}
		response[row] = series[t];
	}

	const auto solution = utils::fitLeastSquares(design, response);
	Eigen::Index offset = 0;
	if (include_intercept_) {
		intercept_ = solution.coefficients[offset++];
	}
	ar_coeffs_ = solution.coefficients.segment(offset, p_);
	offset += p_;
	seasonal_ar_coeffs_ = solution.coefficients.segment(offset, P_);
}

// Layout: [intercept?, ar..., seasonal ar..., ma..., seasonal ma...]
std::vector<double> ARIMA::packParameters() const {
	std::vector<double> params;
	if (include_intercept_) {
		params.push_back(intercept_);
	}
	for (const Eigen::VectorXd *block : {&ar_coeffs_, &seasonal_ar_coeffs_, &ma_coeffs_, &seasonal_ma_coeffs_}) {
		params.insert(params.end(), block->data(), block->data() + block->size());
	}
	return params;
}

void ARIMA::unpackParameters(const std::vector<double> &params) {
	std::size_t idx = 0;
	if (include_intercept_) {
		intercept_ = params[idx++];
	}
	for (Eigen::VectorXd *block : {&ar_coeffs_, &seasonal_ar_coeffs_, &ma_coeffs_, &seasonal_ma_coeffs_}) {
		for (Eigen::Index i = 0; i < block->size(); ++i) {
			(*block)[i] = params[idx++];
		}
	}
}

void ARIMA::refineByConditionalSumOfSquares() {
	const std::vector<double> start = packParameters();
	const std::size_t free_terms = start.size() - static_cast<std::size_t>(q_ + Q_);
	std::vector<double> lower(start.size(), -std::numeric_limits<double>::infinity());
	std::vector<double> upper(start.size(), std::numeric_limits<double>::infinity());
	for (std::size_t i = free_terms; i < start.size(); ++i) {
		lower[i] = -kMaBound;
		upper[i] = kMaBound;
	}

	auto objective = [this](const std::vector<double> &params) {
		unpackParameters(params);
		return conditionalSumOfSquares();
	};

	utils::NelderMeadOptimizer optimizer;
	utils::NelderMeadOptimizer::Options options;
	options.max_iterations = 1000;
	const auto result = optimizer.minimize(objective, start, options, lower, upper);
	if (result.best.empty() || !std::isfinite(result.value)) {
		throw std::runtime_error("ARIMA conditional sum of squares did not produce a finite fit.");
	}
	unpackParameters(result.best);
	STOCKCAST_DEBUG("ARIMA CSS refinement: {} iterations, SSE = {:.6f}", result.iterations, result.value);
}

void ARIMA::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	if (values.size() < minimumObservations()) {
		throw std::invalid_argument("Insufficient data for " + getName() + " order: need " +
		                            std::to_string(minimumObservations()) + " observations, got " +
		                            std::to_string(values.size()) + ".");
	}

	// Non-seasonal differencing, remembering the last value of every level for integration.
	level_tails_.clear();
	std::vector<double> working = values;
	for (int k = 0; k < d_; ++k) {
		level_tails_.push_back(working.back());
		working = difference(working, 1);
	}

	seasonal_tails_.clear();
	if (seasonal_period_ > 1) {
		const std::size_t lag = static_cast<std::size_t>(seasonal_period_);
		for (int k = 0; k < D_; ++k) {
			seasonal_tails_.emplace_back(working.end() - static_cast<std::ptrdiff_t>(lag), working.end());
			working = seasonalDifference(working, 1, seasonal_period_);
		}
	}
	differenced_history_ = std::move(working);
	if (differenced_history_.empty()) {
		throw std::invalid_argument("Differencing removed all observations.");
	}

	estimateAutoregressive();
	ma_coeffs_ = Eigen::VectorXd::Zero(q_);
	seasonal_ma_coeffs_ = Eigen::VectorXd::Zero(Q_);
	if (q_ > 0 || Q_ > 0) {
		refineByConditionalSumOfSquares();
	}
	conditionalSumOfSquares();

	const std::vector<double> effective(residuals_.begin() + maxLag(), residuals_.end());
	double sum_sq = 0.0;
	for (double r : effective) {
		sum_sq += r * r;
	}
	sigma2_ = effective.empty() ? 0.0 : sum_sq / static_cast<double>(effective.size());

	const double loglik = logLikelihood(effective);
	if (std::isfinite(loglik)) {
		const int k = p_ + q_ + P_ + Q_ + (include_intercept_ ? 1 : 0);
		aic_ = -2.0 * loglik + 2.0 * static_cast<double>(k);
	} else {
		aic_.reset();
	}

	is_fitted_ = true;

	if (isSeasonal()) {
		STOCKCAST_INFO("SARIMA({},{},{})({},{},{})[{}] model fitted on {} observations.", p_, d_, q_, P_, D_, Q_,
		               seasonal_period_, values.size());
	} else {
		STOCKCAST_INFO("ARIMA({},{},{}) model fitted on {} observations.", p_, d_, q_, values.size());
	}
	if (p_ > 0) {
		std::stringstream ss;
		ss << ar_coeffs_.transpose();
		STOCKCAST_DEBUG("Non-seasonal AR coeffs: [{}]", ss.str());
	}
	if (q_ > 0) {
		std::stringstream ss;
		ss << ma_coeffs_.transpose();
		STOCKCAST_DEBUG("Non-seasonal MA coeffs: [{}]", ss.str());
	}
	if (seasonal_ar_coeffs_.size() > 0) {
		std::stringstream ss;
		ss << seasonal_ar_coeffs_.transpose();
		STOCKCAST_DEBUG("Seasonal AR coeffs: [{}]", ss.str());
	}
	if (seasonal_ma_coeffs_.size() > 0) {
		std::stringstream ss;
		ss << seasonal_ma_coeffs_.transpose();
		STOCKCAST_DEBUG("Seasonal MA coeffs: [{}]", ss.str());
	}
	STOCKCAST_DEBUG("Intercept: {}", intercept_);
	if (aic_) {
		STOCKCAST_DEBUG("ARIMA diagnostics: AIC = {:.6f}", *aic_);
	}
}

std::vector<double> ARIMA::integrateForecast(std::vector<double> forecast_diff) const {
	std::vector<double> result = std::move(forecast_diff);

	// Seasonal integration first, innermost level last: y_t = diff_t + y_{t-s}.
	const std::size_t lag = static_cast<std::size_t>(seasonal_period_);
	for (auto tail = seasonal_tails_.rbegin(); tail != seasonal_tails_.rend(); ++tail) {
		std::vector<double> integrated;
		integrated.reserve(result.size());
		for (std::size_t h = 0; h < result.size(); ++h) {
			const double base = h < lag ? (*tail)[tail->size() - lag + h] : integrated[h - lag];
			integrated.push_back(result[h] + base);
		}
		result = std::move(integrated);
	}

	for (auto tail = level_tails_.rbegin(); tail != level_tails_.rend(); ++tail) {
		double previous = *tail;
		for (double &value : result) {
			previous += value;
			value = previous;
		}
	}
	return result;
}

core::Forecast ARIMA::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon <= 0) {
		return {};
	}

	std::vector<double> series = differenced_history_;
	std::vector<double> residuals = residuals_;
	std::vector<double> diff_forecast;
	diff_forecast.reserve(static_cast<std::size_t>(horizon));
	for (int h = 0; h < horizon; ++h) {
		const double next = predictStep(series, residuals, series.size());
		diff_forecast.push_back(next);
		series.push_back(next);
		residuals.push_back(0.0);
	}

	core::Forecast forecast;
	forecast.primary() = integrateForecast(std::move(diff_forecast));
	return forecast;
}

ARIMABuilder &ARIMABuilder::withAR(int p) {
	p_ = p;
	return *this;
}

ARIMABuilder &ARIMABuilder::withDifferencing(int d) {
	d_ = d;
	return *this;
}

ARIMABuilder &ARIMABuilder::withMA(int q) {
	q_ = q;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalAR(int P) {
	P_ = P;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalDifferencing(int D) {
	D_ = D;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalMA(int Q) {
	Q_ = Q;
	return *this;
}

ARIMABuilder &ARIMABuilder::withSeasonalPeriod(int s) {
	s_ = s;
	return *this;
}

ARIMABuilder &ARIMABuilder::withIntercept(bool include_intercept) {
	include_intercept_ = include_intercept;
	return *this;
}

std::unique_ptr<ARIMA> ARIMABuilder::build() {
	return std::unique_ptr<ARIMA>(new ARIMA(p_, d_, q_, P_, D_, Q_, s_, include_intercept_));
}

} // namespace stockcast::models
