#pragma once

#include "stockcast/core/demand.hpp"
#include "stockcast/pipeline/request.hpp"

#include <vector>

namespace stockcast::source {

/**
 * @class ISeriesSource
 * @brief Supplies the summed quantities of done outbound moves per truncated date.
 *
 * Implementations apply the request scope, target and date filters. The
 * returned buckets may have gaps and need not be sorted.
 */
class ISeriesSource {
public:
	virtual ~ISeriesSource() = default;

	virtual std::vector<core::RawBucket> fetch(const pipeline::ForecastRequest &request) = 0;
};

} // namespace stockcast::source
