#pragma once

#include "stockcast/core/demand.hpp"
#include "stockcast/core/time_series.hpp"

#include <optional>
#include <vector>

namespace stockcast::pipeline {

/**
 * @brief Turns grouped move totals into a gap-free series.
 *
 * The buckets are sorted, extended with zero buckets at @p date_start and
 * @p date_end when the data starts later or ends earlier, truncated to
 * @p interval, summed per bucket and filled with 0.0 where nothing moved.
 *
 * @return std::nullopt when @p raw is empty, which callers report as "no data"
 *         rather than as an all-zero series.
 */
std::optional<core::TimeSeries> normalizeSeries(std::vector<core::RawBucket> raw, core::Interval interval,
                                                const std::optional<core::Date> &date_start = std::nullopt,
                                                const std::optional<core::Date> &date_end = std::nullopt);

} // namespace stockcast::pipeline
