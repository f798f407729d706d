#include "stockcast/pipeline/normalizer.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace stockcast::pipeline {

std::optional<core::TimeSeries> normalizeSeries(std::vector<core::RawBucket> raw, core::Interval interval,
                                                const std::optional<core::Date> &date_start,
                                                const std::optional<core::Date> &date_end) {
	if (raw.empty()) {
		return std::nullopt;
	}
	for (const auto &bucket : raw) {
		if (!std::isfinite(bucket.quantity)) {
			throw std::invalid_argument("Bucket " + bucket.bucket_start.toString() + " has a non-finite quantity.");
		}
	}

	std::stable_sort(raw.begin(), raw.end(), [](const core::RawBucket &lhs, const core::RawBucket &rhs) {
		return lhs.bucket_start < rhs.bucket_start;
	});
	if (date_start && raw.front().bucket_start > *date_start) {
		raw.push_back(core::RawBucket {*date_start, 0.0});
	}
	if (date_end && raw.back().bucket_start < *date_end) {
		raw.push_back(core::RawBucket {*date_end, 0.0});
	}

	core::Date first = core::truncate(raw.front().bucket_start, interval);
	core::Date last = first;
	for (const auto &bucket : raw) {
		const auto truncated = core::truncate(bucket.bucket_start, interval);
		first = std::min(first, truncated);
		last = std::max(last, truncated);
	}

	const long span = core::bucketDistance(first, last, interval) + 1;
	std::vector<double> values(static_cast<std::size_t>(span), 0.0);
	for (const auto &bucket : raw) {
		const long index = core::bucketDistance(first, bucket.bucket_start, interval);
		values[static_cast<std::size_t>(index)] += bucket.quantity;
	}

	std::vector<core::Date> buckets;
	buckets.reserve(values.size());
	for (long i = 0; i < span; ++i) {
		buckets.push_back(core::advance(first, interval, i));
	}

	STOCKCAST_DEBUG("Normalized {} raw buckets into {} {} buckets from {} to {}", raw.size(), values.size(),
	                core::toString(interval), first.toString(), last.toString());
	return core::TimeSeries(interval, std::move(buckets), std::move(values));
}

} // namespace stockcast::pipeline
