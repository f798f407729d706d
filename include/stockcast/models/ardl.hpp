#pragma once

#include "stockcast/models/iforecaster.hpp"
#include "stockcast/utils/logging.hpp"

#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace stockcast::models {

class ARDLBuilder; // Forward declaration

/**
 * @brief An exogenous regressor entering an ARDL model with lags 0..order.
 *
 * @c history must be aligned with the fitted series; @c future holds the
 * values for the forecast horizon and must cover every predicted step.
 */
struct DistributedLagRegressor {
	std::string name;
	std::vector<double> history;
	std::vector<double> future;
	int order = 0;
};

/**
 * @class ARDL
 * @brief Autoregressive distributed lag model estimated by least squares.
 *
 * y_t = c + sum_{i=1..lags} phi_i y_{t-i} + sum_k sum_{j=0..order_k} beta_kj x_k,{t-j} + e_t
 *
 * Without exogenous regressors the model is a plain autoregression with a
 * constant, which is how demand series are forecast.
 */
class ARDL final : public IForecaster {
public:
	friend class ARDLBuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "ARDL";
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
	/// Distributed lag coefficients of regressor @p index, lag 0 first.
	const Eigen::VectorXd &regressorCoefficients(std::size_t index) const;

private:
	ARDL(int lags, bool include_constant, std::vector<DistributedLagRegressor> regressors);

	int maxLag() const;

	int lags_;
	bool include_constant_;
	std::vector<DistributedLagRegressor> regressors_;
	double intercept_ = 0.0;
	Eigen::VectorXd ar_coeffs_;
	std::vector<Eigen::VectorXd> regressor_coeffs_;
	std::vector<double> history_;
	bool is_fitted_ = false;
};

class ARDLBuilder {
public:
	ARDLBuilder &withLags(int lags);
	ARDLBuilder &withConstant(bool include_constant);
	ARDLBuilder &withRegressor(DistributedLagRegressor regressor);
	std::unique_ptr<ARDL> build();

private:
	int lags_ = 1;
	bool include_constant_ = true;
	std::vector<DistributedLagRegressor> regressors_;
};

} // namespace stockcast::models
