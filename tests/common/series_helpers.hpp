#pragma once

#include "stockcast/core/demand.hpp"
#include "stockcast/core/time_series.hpp"
#include "stockcast/source/series_source.hpp"

#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace tests::helpers {

inline stockcast::core::Date date(const std::string &text) {
	return stockcast::core::Date::parse(text);
}

inline stockcast::core::TimeSeries makeDailySeries(std::vector<double> values,
                                                   const std::string &start = "2024-01-01") {
	return stockcast::core::TimeSeries::fromValues(std::move(values), stockcast::core::Interval::Day, date(start));
}

inline std::vector<stockcast::core::RawBucket>
makeRawBuckets(const std::vector<std::pair<std::string, double>> &entries) {
	std::vector<stockcast::core::RawBucket> buckets;
	buckets.reserve(entries.size());
	for (const auto &[when, quantity] : entries) {
		buckets.push_back(stockcast::core::RawBucket {date(when), quantity});
	}
	return buckets;
}

/// Deterministic AR(1) path without noise: y_t = phi * y_{t-1}.
inline std::vector<double> generateARSeries(double phi, double start, std::size_t length) {
	std::vector<double> series;
	series.reserve(length);
	series.push_back(start);
	for (std::size_t i = 1; i < length; ++i) {
		series.push_back(phi * series.back());
	}
	return series;
}

/// Series source returning fixed buckets and counting how often it was asked.
class StaticSeriesSource final : public stockcast::source::ISeriesSource {
public:
	explicit StaticSeriesSource(std::vector<stockcast::core::RawBucket> buckets) : buckets_(std::move(buckets)) {
	}

	std::vector<stockcast::core::RawBucket> fetch(const stockcast::pipeline::ForecastRequest &) override {
		++calls_;
		return buckets_;
	}

	int calls() const {
		return calls_;
	}

private:
	std::vector<stockcast::core::RawBucket> buckets_;
	int calls_ = 0;
};

/// True when @p value has at most two decimals.
inline bool hasTwoDecimals(double value) {
	const double scaled = value * 100.0;
	return std::abs(scaled - std::round(scaled)) < 1e-6;
}

} // namespace tests::helpers
