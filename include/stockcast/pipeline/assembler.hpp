#pragma once

#include "stockcast/core/demand.hpp"
#include "stockcast/core/time_series.hpp"

#include <vector>

namespace stockcast::pipeline {

/**
 * @brief Merges history and forecast into one ascending record list.
 *
 * History buckets come first with is_forecast = false, followed by the
 * forecast buckets (is_forecast = true) when @p forecast holds a value.
 */
std::vector<core::DemandRecord> assembleDemand(const core::TimeSeries &history,
                                               const core::ForecastOutcome &forecast);

} // namespace stockcast::pipeline
