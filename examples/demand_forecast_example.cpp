#include "stockcast/pipeline/defaults.hpp"
#include "stockcast/pipeline/demand_pipeline.hpp"
#include "stockcast/report/presentation.hpp"
#include "stockcast/source/move_ledger.hpp"
#include "stockcast/source/sql_query.hpp"
#include "stockcast/utils/logging.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>

using namespace stockcast;

namespace {

constexpr std::int64_t kCompany = 1;
constexpr std::int64_t kWarehouse = 10;
constexpr std::int64_t kStock = 11;
constexpr std::int64_t kPickingZone = 12;
constexpr std::int64_t kCustomers = 90;
constexpr std::int64_t kProduct = 501;
constexpr std::int64_t kTemplate = 50;

source::MoveLedger buildLedger(const core::Date &first_day, int days) {
	source::MoveLedger ledger(kCompany);
	ledger.addLocation({kWarehouse, std::nullopt, kCompany, true});
	ledger.addLocation({kStock, kWarehouse, kCompany, true});
	ledger.addLocation({kPickingZone, kStock, kCompany, true});
	ledger.addLocation({kCustomers, std::nullopt, kCompany, false});
	ledger.addProduct(kProduct, kTemplate);
	ledger.addProduct(kProduct + 1, kTemplate);

	std::mt19937 rng(7);
	std::poisson_distribution<int> orders(3);
	for (int day = 0; day < days; ++day) {
		const auto when = first_day.addDays(day);
		// Weekday demand with a mild summer peak.
		if (when.weekday() >= 5) {
			continue;
		}
		const double season = 1.0 + 0.4 * std::sin(2.0 * M_PI * static_cast<double>(when.month() - 3) / 12.0);
		const int quantity = static_cast<int>(std::round(orders(rng) * season));
		if (quantity == 0) {
			continue;
		}
		const std::int64_t from = day % 3 == 0 ? kPickingZone : kStock;
		ledger.addMove({kProduct, kCompany, from, kCustomers, when, static_cast<double>(quantity),
		                source::MoveState::Done});
		if (day % 5 == 0) {
			ledger.addMove({kProduct + 1, kCompany, kStock, kCustomers, when, 1.0, source::MoveState::Done});
		}
		if (day % 11 == 0) {
			// Replenishment inside the warehouse never counts as demand.
			ledger.addMove({kProduct, kCompany, kStock, kPickingZone, when, 10.0, source::MoveState::Done});
		}
	}
	return ledger;
}

void printRecords(const std::vector<core::DemandRecord> &records) {
	for (const auto &record : report::reportOrder(records)) {
		std::cout << "    " << record.date << "  " << std::setw(8) << std::fixed << std::setprecision(2)
		          << record.quantity << (record.is_forecast ? "  (forecast)" : "") << '\n';
	}
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
#ifndef STOCKCAST_NO_LOGGING
	utils::Logging::init(spdlog::level::warn);
#endif

	const core::Date today(2024, 10, 15);
	auto ledger = buildLedger(core::Date(2023, 10, 1), 380);
	std::cout << "Ledger holds " << ledger.moveCount() << " stock moves\n\n";

	const std::map<std::string, std::string> settings {{pipeline::ForecastDefaults::kIntervalKey, "month"},
	                                                   {pipeline::ForecastDefaults::kPredictedPeriodsKey, "3"},
	                                                   {pipeline::ForecastDefaults::kMethodKey, "ar"}};
	const auto defaults = pipeline::ForecastDefaults::fromSettings(settings);

	auto request = pipeline::newRequest(defaults, today);
	request.target_id = kProduct;
	request.location_id = kStock;
	request.date_start = core::Date(2023, 10, 1);

	pipeline::DemandPipeline demand(ledger);
	for (auto method : {pipeline::ForecastMethod::AR, pipeline::ForecastMethod::ARDL, pipeline::ForecastMethod::ARIMA,
	                    pipeline::ForecastMethod::SARIMA, pipeline::ForecastMethod::HWES,
	                    pipeline::ForecastMethod::SES}) {
		request.parameters.method = method;
		request.parameters.lags = method == pipeline::ForecastMethod::AR || method == pipeline::ForecastMethod::ARDL ? 2 : 0;
		pipeline::onMethodChanged(request, defaults);

		const auto result = demand.compute(request);
		std::cout << "Method " << pipeline::toString(method) << " (" << request.predicted_periods << " period(s))";
		if (!result.hasData()) {
			std::cout << ": no data\n";
			continue;
		}
		std::cout << (result.forecast_available ? "" : ", forecast unavailable") << '\n';
		printRecords(result.records);
		std::cout << '\n';
	}

	// Template demand of the whole company, exported as a delimited table.
	auto company = pipeline::newRequest(defaults, today);
	company.scope = pipeline::DemandScope::Company;
	company.target = pipeline::DemandTarget::Template;
	company.target_id = kTemplate;
	company.interval = core::Interval::Quarter;
	pipeline::onIntervalChanged(company, today);

	const auto query = source::SqlQueryBuilder::build(company, kCompany);
	std::cout << "Equivalent SQL query:\n" << query.text << "\n\n";

	const auto exported = demand.compute(company);
	if (exported.hasData()) {
		std::cout << "Export " << report::exportFileName("Desk Lamp", today) << ":\n";
		report::writeDelimited(std::cout, exported.records);
	}

	company.target_id = kTemplate + 1;
	if (!demand.compute(company).hasData()) {
		const report::NoDataNotice notice;
		std::cout << '\n' << notice.title << ": " << notice.message << '\n';
	}
	return 0;
}
