#include "stockcast/models/autoregression.hpp"
#include "stockcast/utils/least_squares.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

namespace stockcast::models {

AutoRegression::AutoRegression(int lags, bool include_constant) : lags_(lags), include_constant_(include_constant) {
	if (lags_ < 0) {
		throw std::invalid_argument("AR lag order must be non-negative.");
	}
	if (lags_ == 0 && !include_constant_) {
		throw std::invalid_argument("AR(0) without a constant has no parameters to estimate.");
	}
}

void AutoRegression::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	const int n = static_cast<int>(values.size());
	const int params = lags_ + (include_constant_ ? 1 : 0);
	const int observations = n - lags_;
	if (observations < params || observations <= 0) {
		throw std::invalid_argument("Insufficient data for AR(" + std::to_string(lags_) + "): " + std::to_string(n) +
		                            " observations available.");
	}

	Eigen::MatrixXd design(observations, params);
	Eigen::VectorXd response(observations);
	for (int row = 0; row < observations; ++row) {
		const int t = row + lags_;
		int col = 0;
		if (include_constant_) {
			design(row, col++) = 1.0;
		}
		for (int i = 1; i <= lags_; ++i) {
			design(row, col++) = values[t - i];
		}
		response[row] = values[t];
	}

	const auto solution = utils::fitLeastSquares(design, response);
	intercept_ = include_constant_ ? solution.coefficients[0] : 0.0;
	ar_coeffs_ = solution.coefficients.tail(lags_);
	sigma2_ = solution.sigma2;
	history_ = values;
	is_fitted_ = true;

	STOCKCAST_INFO("AR({}) model fitted on {} observations.", lags_, observations);
	if (lags_ > 0) {
		std::stringstream ss;
		ss << ar_coeffs_.transpose();
		STOCKCAST_DEBUG("AR coeffs: [{}], intercept: {}", ss.str(), intercept_);
	}
}

core::Forecast AutoRegression::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon <= 0) {
		return {};
	}

	std::vector<double> path = history_;
	core::Forecast forecast;
	auto &series = forecast.primary();
	series.reserve(static_cast<std::size_t>(horizon));
	for (int h = 0; h < horizon; ++h) {
		double next = intercept_;
		for (int i = 0; i < lags_; ++i) {
			next += ar_coeffs_[i] * path[path.size() - static_cast<std::size_t>(i) - 1];
		}
		path.push_back(next);
		series.push_back(next);
	}
	return forecast;
}

AutoRegressionBuilder &AutoRegressionBuilder::withLags(int lags) {
	lags_ = lags;
	return *this;
}

AutoRegressionBuilder &AutoRegressionBuilder::withConstant(bool include_constant) {
	include_constant_ = include_constant;
	return *this;
}

std::unique_ptr<AutoRegression> AutoRegressionBuilder::build() {
	return std::unique_ptr<AutoRegression>(new AutoRegression(lags_, include_constant_));
}

} // namespace stockcast::models
