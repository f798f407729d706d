#pragma once

#include "stockcast/models/iforecaster.hpp"
#include "stockcast/utils/logging.hpp"

#include <Eigen/Dense>
#include <memory>
#include <vector>

namespace stockcast::models {

class AutoRegressionBuilder; // Forward declaration

/**
 * @class AutoRegression
 * @brief AR(lags) model estimated by conditional least squares.
 *
 * y_t = c + phi_1 * y_{t-1} + ... + phi_lags * y_{t-lags} + e_t
 *
 * With zero lags the model reduces to the sample mean.
 */
class AutoRegression final : public IForecaster {
public:
	friend class AutoRegressionBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "AutoRegression";
	}

	int lags() const {
		return lags_;
	}
	double intercept() const {
		return intercept_;
	}
	const Eigen::VectorXd &arCoefficients() const {
		return ar_coeffs_;
	}
	double sigma2() const {
		return sigma2_;
	}

private:
	AutoRegression(int lags, bool include_constant);

	int lags_;
	bool include_constant_;
	double intercept_ = 0.0;
	Eigen::VectorXd ar_coeffs_;
	double sigma2_ = 0.0;
	std::vector<double> history_;
	bool is_fitted_ = false;
};

class AutoRegressionBuilder {
public:
	AutoRegressionBuilder &withLags(int lags);
	AutoRegressionBuilder &withConstant(bool include_constant);
	std::unique_ptr<AutoRegression> build();

private:
	int lags_ = 1;
	bool include_constant_ = true;
};

} // namespace stockcast::models
