#include "stockcast/models/ardl.hpp"
#include "stockcast/utils/least_squares.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace stockcast::models {

ARDL::ARDL(int lags, bool include_constant, std::vector<DistributedLagRegressor> regressors)
    : lags_(lags), include_constant_(include_constant), regressors_(std::move(regressors)) {
	if (lags_ < 0) {
		throw std::invalid_argument("ARDL lag order must be non-negative.");
	}
	for (const auto &regressor : regressors_) {
		if (regressor.order < 0) {
			throw std::invalid_argument("Distributed lag order of '" + regressor.name + "' must be non-negative.");
		}
	}
	if (lags_ == 0 && !include_constant_ && regressors_.empty()) {
		throw std::invalid_argument("ARDL model has no parameters to estimate.");
	}
}

int ARDL::maxLag() const {
	int max_lag = lags_;
	for (const auto &regressor : regressors_) {
		max_lag = std::max(max_lag, regressor.order);
	}
	return max_lag;
}

const Eigen::VectorXd &ARDL::regressorCoefficients(std::size_t index) const {
	if (index >= regressor_coeffs_.size()) {
		throw std::out_of_range("Regressor index out of range.");
	}
	return regressor_coeffs_[index];
}

void ARDL::fit(const core::TimeSeries &ts) {
	const auto &values = ts.getValues();
	const int n = static_cast<int>(values.size());
	for (const auto &regressor : regressors_) {
		if (static_cast<int>(regressor.history.size()) != n) {
			throw std::invalid_argument("Regressor '" + regressor.name + "' must be aligned with the series.");
		}
	}

	int params = lags_ + (include_constant_ ? 1 : 0);
	for (const auto &regressor : regressors_) {
		params += regressor.order + 1;
	}
	const int start = maxLag();
	const int observations = n - start;
	if (observations < params || observations <= 0) {
		throw std::invalid_argument("Insufficient data for ARDL(" + std::to_string(lags_) + "): " +
		                            std::to_string(n) + " observations available.");
	}

	Eigen::MatrixXd design(observations, params);
	Eigen::VectorXd response(observations);
	for (int row = 0; row < observations; ++row) {
		const int t = row + start;
		int col = 0;
		if (include_constant_) {
			design(row, col++) = 1.0;
		}
		for (int i = 1; i <= lags_; ++i) {
			design(row, col++) = values[t - i];
		}
		for (const auto &regressor : regressors_) {
			for (int j = 0; j <= regressor.order; ++j) {
				design(row, col++) = regressor.history[t - j];
			}
		}
		response[row] = values[t];
	}

	const auto solution = utils::fitLeastSquares(design, response);
	Eigen::Index offset = 0;
	intercept_ = include_constant_ ? solution.coefficients[offset++] : 0.0;
	ar_coeffs_ = solution.coefficients.segment(offset, lags_);
	offset += lags_;
	regressor_coeffs_.clear();
	for (const auto &regressor : regressors_) {
		regressor_coeffs_.push_back(solution.coefficients.segment(offset, regressor.order + 1));
		offset += regressor.order + 1;
	}
	history_ = values;
	is_fitted_ = true;

	STOCKCAST_INFO("ARDL({}) model fitted on {} observations with {} exogenous regressor(s).", lags_, observations,
	               regressors_.size());
	if (lags_ > 0) {
		std::stringstream ss;
		ss << ar_coeffs_.transpose();
		STOCKCAST_DEBUG("ARDL lag coeffs: [{}], intercept: {}", ss.str(), intercept_);
	}
}

core::Forecast ARDL::predict(int horizon) {
	if (!is_fitted_) {
		throw std::runtime_error("Predict called before fit.");
	}
	if (horizon <= 0) {
		return {};
	}
	for (const auto &regressor : regressors_) {
		if (static_cast<int>(regressor.future.size()) < horizon) {
			throw std::invalid_argument("Regressor '" + regressor.name + "' has no future values for the horizon.");
		}
	}

	const std::size_t n = history_.size();
	std::vector<double> path = history_;
	core::Forecast forecast;
	auto &series = forecast.primary();
	series.reserve(static_cast<std::size_t>(horizon));
	for (int h = 0; h < horizon; ++h) {
		const std::size_t t = n + static_cast<std::size_t>(h);
		double next = intercept_;
		for (int i = 0; i < lags_; ++i) {
			next += ar_coeffs_[i] * path[t - static_cast<std::size_t>(i) - 1];
		}
		for (std::size_t k = 0; k < regressors_.size(); ++k) {
			const auto &regressor = regressors_[k];
			for (int j = 0; j <= regressor.order; ++j) {
				const std::size_t index = t - static_cast<std::size_t>(j);
				const double x = index < n ? regressor.history[index] : regressor.future[index - n];
				next += regressor_coeffs_[k][j] * x;
			}
		}
		path.push_back(next);
		series.push_back(next);
	}
	return forecast;
}

ARDLBuilder &ARDLBuilder::withLags(int lags) {
	lags_ = lags;
	return *this;
}

ARDLBuilder &ARDLBuilder::withConstant(bool include_constant) {
	include_constant_ = include_constant;
	return *this;
}

ARDLBuilder &ARDLBuilder::withRegressor(DistributedLagRegressor regressor) {
	regressors_.push_back(std::move(regressor));
	return *this;
}

std::unique_ptr<ARDL> ARDLBuilder::build() {
	return std::unique_ptr<ARDL>(new ARDL(lags_, include_constant_, regressors_));
}

} // namespace stockcast::models
