#pragma once

#include <cstddef>
#include <vector>

namespace stockcast::core {

/**
 * @struct Forecast
 * @brief Point predictions produced by a model, one value per future bucket.
 */
struct Forecast {
	using Value = double;
	using Series = std::vector<Value>;

	Series point;

	Series &primary() {
		return point;
	}

	const Series &primary() const {
		return point;
	}

	bool empty() const {
		return point.empty();
	}

	/// Returns the forecast horizon (number of steps).
	std::size_t horizon() const {
		return point.size();
	}
};

} // namespace stockcast::core
