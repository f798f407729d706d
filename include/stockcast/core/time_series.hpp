#pragma once

#include "stockcast/core/calendar.hpp"

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace stockcast::core {

/**
 * @class TimeSeries
 * @brief A regular, gap-free sequence of demand buckets.
 *
 * Bucket starts and quantities are stored in separate vectors so models can
 * work on the contiguous value array directly. Construction enforces that
 * every bucket is truncated to the series interval and that consecutive
 * buckets are exactly one interval apart.
 */
class TimeSeries {
public:
	using Value = double;

	TimeSeries() = default;

	/**
	 * @brief Constructs a series from bucket starts and quantities.
	 * @throws std::invalid_argument If sizes differ, a bucket is not truncated,
	 *         or the buckets are not strictly contiguous.
	 */
	TimeSeries(Interval interval, std::vector<Date> buckets, std::vector<Value> values)
	    : interval_(interval), buckets_(std::move(buckets)), values_(std::move(values)) {
		if (buckets_.size() != values_.size()) {
			throw std::invalid_argument("Bucket and value vectors must have the same size.");
		}
		validateBuckets();
	}

	/**
	 * @brief Builds a series of consecutive buckets starting at @p start.
	 *
	 * Convenient for models and tests that only care about the values.
	 */
	static TimeSeries fromValues(std::vector<Value> values, Interval interval = Interval::Day,
	                             Date start = Date()) {
		std::vector<Date> buckets;
		buckets.reserve(values.size());
		const Date first = truncate(start, interval);
		for (std::size_t i = 0; i < values.size(); ++i) {
			buckets.push_back(advance(first, interval, static_cast<long>(i)));
		}
		return TimeSeries(interval, std::move(buckets), std::move(values));
	}

	Interval interval() const {
		return interval_;
	}

	const std::vector<Date> &getBuckets() const {
		return buckets_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	std::size_t size() const {
		return values_.size();
	}

	bool empty() const {
		return values_.empty();
	}

	const Date &front() const {
		if (empty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return buckets_.front();
	}

	const Date &back() const {
		if (empty()) {
			throw std::out_of_range("TimeSeries is empty.");
		}
		return buckets_.back();
	}

	/// Bucket start @p steps buckets after the last bucket of the series.
	Date bucketAfterEnd(std::size_t steps = 1) const {
		return advance(back(), interval_, static_cast<long>(steps));
	}

private:
	void validateBuckets() const {
		for (std::size_t i = 0; i < buckets_.size(); ++i) {
			if (truncate(buckets_[i], interval_) != buckets_[i]) {
				throw std::invalid_argument("Bucket " + buckets_[i].toString() + " is not aligned to a " +
				                            toString(interval_) + " boundary.");
			}
			if (i > 0 && bucketDistance(buckets_[i - 1], buckets_[i], interval_) != 1) {
				throw std::invalid_argument("Buckets must be strictly ascending without gaps.");
			}
		}
	}

	Interval interval_ = Interval::Day;
	std::vector<Date> buckets_;
	std::vector<Value> values_;
};

} // namespace stockcast::core
