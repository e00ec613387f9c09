#pragma once

#include <chrono>

// Retry bounds for the three upload phases. Authorization failures and
// transient failures are counted separately.
struct RetryPolicy {
	// Initiate and Finish
	int phase_auth_retries = 2;
	int phase_transient_retries = 2;

	// per block, counting the first try
	int part_max_attempts = 5;
	int part_auth_retries = 4;

	std::chrono::milliseconds backoff{1000};
	double backoff_multiplier = 1.0;	   // 1.0 keeps the delay fixed
	std::chrono::milliseconds max_backoff{30000};

	// Delay before the given retry (1 for the first retry).
	std::chrono::milliseconds Backoff(int retry) const noexcept;
};
