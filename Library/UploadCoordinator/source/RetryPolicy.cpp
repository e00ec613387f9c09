#include "RetryPolicy.hpp"

#include <algorithm>
#include <cmath>

std::chrono::milliseconds RetryPolicy::Backoff(int retry) const noexcept
{
	if (backoff.count() <= 0)
		return std::chrono::milliseconds(0);

	if (retry <= 1 || backoff_multiplier <= 1.0)
		return std::min(backoff, max_backoff);

	const double scaled = static_cast<double>(backoff.count()) * std::pow(backoff_multiplier, retry - 1);
	const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));

	return std::chrono::milliseconds(static_cast<long long>(capped));
}
