#pragma once

#include "stockcast/models/iforecaster.hpp"
#include "stockcast/utils/logging.hpp"

#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace stockcast::models {

class ARIMABuilder; // Forward declaration

/**
 * @class ARIMA
 * @brief Seasonal ARIMA(p,d,q)(P,D,Q)[s] model.
 *
 * The series is differenced d times and then seasonally differenced D times
 * with lag s. AR terms (and the constant, when present) are estimated by
 * conditional least squares on the differenced series. With MA terms all
 * coefficients are then refined by minimising the conditional sum of squared
 * residuals. Forecasts are integrated back and returned as levels of the
 * original series.
 *
 * A constant is included by default only when the series is not
 * differenced. Without it the differenced series is modelled as is, so a
 * persistent drift carries over into the forecast.
 */
class ARIMA final : public IForecaster {
public:
	friend class ARIMABuilder;

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return isSeasonal() ? "SARIMA" : "ARIMA";
	}

	const Eigen::VectorXd &arCoefficients() const {
		return ar_coeffs_;
	}
	const Eigen::VectorXd &maCoefficients() const {
		return ma_coeffs_;
	}
	const Eigen::VectorXd &seasonalARCoefficients() const {
		return seasonal_ar_coeffs_;
	}
	const Eigen::VectorXd &seasonalMACoefficients() const {
		return seasonal_ma_coeffs_;
	}
	const std::vector<double> &residuals() const {
		return residuals_;
	}
	int seasonalPeriod() const {
		return seasonal_period_;
	}
	bool includesIntercept() const {
		return include_intercept_;
	}
	double intercept() const {
		return intercept_;
	}
	/// Mean squared one-step residual of the differenced series.
	double sigma2() const {
		return sigma2_;
	}
	std::optional<double> aic() const {
		return aic_;
	}

	/**
	 * @brief Minimum number of observations needed to fit this order.
	 */
	std::size_t minimumObservations() const;

	// Static utility methods (public for testing)
	static std::vector<double> difference(const std::vector<double> &data, int d);
	static std::vector<double> seasonalDifference(const std::vector<double> &data, int D, int s);

private:
	ARIMA(int p, int d, int q, int P, int D, int Q, int s, std::optional<bool> include_intercept);

	bool isSeasonal() const {
		return seasonal_period_ > 1 && (P_ > 0 || D_ > 0 || Q_ > 0);
	}
	int maxLag() const;
	double predictStep(const std::vector<double> &series, const std::vector<double> &residuals,
	                   std::size_t t) const;
	void computeResiduals();
	void estimateAutoregressive();
	void refineByConditionalSumOfSquares();
	// Recomputes residuals_ for the current coefficients and returns their sum of squares.
	double conditionalSumOfSquares();
	std::vector<double> packParameters() const;
	void unpackParameters(const std::vector<double> &params);
	std::vector<double> integrateForecast(std::vector<double> forecast_diff) const;
	static double logLikelihood(const std::vector<double> &residuals);

	int p_, d_, q_;
	int P_, D_, Q_;
	int seasonal_period_;
	bool include_intercept_;
	Eigen::VectorXd ar_coeffs_;
	Eigen::VectorXd ma_coeffs_;
	Eigen::VectorXd seasonal_ar_coeffs_;
	Eigen::VectorXd seasonal_ma_coeffs_;
	double intercept_ = 0.0;
	std::vector<double> differenced_history_;
	// Last value of each non-seasonally differenced level (index k = k-th difference).
	std::vector<double> level_tails_;
	// Last s values of each seasonally differenced level, taken after non-seasonal differencing.
	std::vector<std::vector<double>> seasonal_tails_;
	std::vector<double> residuals_;
	double sigma2_ = 0.0;
	std::optional<double> aic_;
	bool is_fitted_ = false;
};

class ARIMABuilder {
public:
	ARIMABuilder &withAR(int p);
	ARIMABuilder &withDifferencing(int d);
	ARIMABuilder &withMA(int q);
	ARIMABuilder &withSeasonalAR(int P);
	ARIMABuilder &withSeasonalDifferencing(int D);
	ARIMABuilder &withSeasonalMA(int Q);
	ARIMABuilder &withSeasonalPeriod(int s);
	ARIMABuilder &withIntercept(bool include_intercept);
	std::unique_ptr<ARIMA> build();

private:
	int p_ = 0;
	int d_ = 0;
	int q_ = 0;
	int P_ = 0;
	int D_ = 0;
	int Q_ = 0;
	int s_ = 0;
	std::optional<bool> include_intercept_;
};

} // namespace stockcast::models
