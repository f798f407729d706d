#include "stockcast/pipeline/request.hpp"

namespace stockcast::pipeline {

std::string toString(ForecastMethod method) {
	switch (method) {
	case ForecastMethod::AR:
		return "ar";
	case ForecastMethod::ARDL:
		return "ardl";
	case ForecastMethod::ARIMA:
		return "arima";
	case ForecastMethod::SARIMA:
		return "sarima";
	case ForecastMethod::HWES:
		return "hwes";
	case ForecastMethod::SES:
		return "ses";
	}
	throw std::invalid_argument("Unknown forecast method.");
}

ForecastMethod parseMethod(const std::string &key) {
	if (key == "ar" || key == "_ar_method") {
		return ForecastMethod::AR;
	}
	if (key == "ardl" || key == "_ma_method") {
		return ForecastMethod::ARDL;
	}
	if (key == "arima" || key == "_arima_method") {
		return ForecastMethod::ARIMA;
	}
	if (key == "sarima" || key == "_sarima_method") {
		return ForecastMethod::SARIMA;
	}
	if (key == "hwes" || key == "_hwes_method") {
		return ForecastMethod::HWES;
	}
	if (key == "ses" || key == "_ses_method") {
		return ForecastMethod::SES;
	}
	throw std::invalid_argument("Unknown forecast method '" + key + "'.");
}

bool isSinglePeriodMethod(ForecastMethod method) {
	return method == ForecastMethod::HWES || method == ForecastMethod::SES;
}

void ForecastRequest::validate() const {
	if (predicted_periods <= 0) {
		throw InvalidRequest("Number of periods should be positive.");
	}
	if (date_start && date_end && !(*date_end > *date_start)) {
		throw InvalidRequest("Date end should be after date start.");
	}
	if (target_id <= 0) {
		throw InvalidRequest(target == DemandTarget::Product ? "A product is required."
		                                                     : "A product template is required.");
	}
	if (scope == DemandScope::Location && !location_id) {
		throw InvalidRequest("Location demand requires a location.");
	}
	const auto &params = parameters;
	if (params.lags < 0 || params.seasons < 0) {
		throw InvalidRequest("Lags and seasons must be non-negative.");
	}
	if (params.p < 0 || params.d < 0 || params.q < 0 || params.seasonal_p < 0 || params.seasonal_d < 0 ||
	    params.seasonal_q < 0) {
		throw InvalidRequest("Model orders must be non-negative.");
	}
}

} // namespace stockcast::pipeline
