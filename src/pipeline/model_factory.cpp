#include "stockcast/pipeline/model_factory.hpp"

#include "stockcast/models/ardl.hpp"
#include "stockcast/models/arima.hpp"
#include "stockcast/models/autoregression.hpp"
#include "stockcast/models/holt_winters.hpp"
#include "stockcast/models/ses.hpp"
#include "stockcast/utils/logging.hpp"

namespace stockcast::pipeline {

std::unique_ptr<models::IForecaster> ModelFactory::create(const ForecastParameters &params) {
	STOCKCAST_DEBUG("Creating model for method '{}'", toString(params.method));

	switch (params.method) {
	case ForecastMethod::AR:
		return models::AutoRegressionBuilder().withLags(params.lags).build();
	case ForecastMethod::ARDL:
		return models::ARDLBuilder().withLags(params.lags).build();
	case ForecastMethod::ARIMA:
		return models::ARIMABuilder().withAR(params.p).withDifferencing(params.d).withMA(params.q).build();
	case ForecastMethod::SARIMA:
		return models::ARIMABuilder()
		    .withAR(params.p)
		    .withDifferencing(params.d)
		    .withMA(params.q)
		    .withSeasonalAR(params.seasonal_p)
		    .withSeasonalDifferencing(params.seasonal_d)
		    .withSeasonalMA(params.seasonal_q)
		    .withSeasonalPeriod(params.seasons)
		    .build();
	case ForecastMethod::HWES:
		return std::make_unique<models::HoltWinters>();
	case ForecastMethod::SES:
		return models::SimpleExponentialSmoothingBuilder().withOptimizedAlpha().build();
	}
	throw std::invalid_argument("Unknown forecast method.");
}

} // namespace stockcast::pipeline
