#include "ConcurrencyLimiter.hpp"

#include <algorithm>
#include <chrono>

namespace {
	// UploadContext does not signal this condition variable, so waiters
	// poll for cancellation at this interval.
	constexpr std::chrono::milliseconds kCancelPollInterval{50};
}

ConcurrencyLimiter::ConcurrencyLimiter(std::size_t capacity)
	: capacity_(std::max<std::size_t>(capacity, 1))
{
}

bool ConcurrencyLimiter::Acquire(const UploadContext& context)
{
	std::unique_lock<std::mutex> lock(mutex_);

	while (in_use_ >= capacity_) {
		if (context.IsCancelled())
			return false;

		cv_.wait_for(lock, kCancelPollInterval);
	}

	if (context.IsCancelled())
		return false;

	in_use_++;
	peak_ = std::max(peak_, in_use_);

	return true;
}

void ConcurrencyLimiter::Acquire()
{
	std::unique_lock<std::mutex> lock(mutex_);
	cv_.wait(lock, [this] { return in_use_ < capacity_; });

	in_use_++;
	peak_ = std::max(peak_, in_use_);
}

void ConcurrencyLimiter::Release() noexcept
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		if (in_use_ > 0)
			in_use_--;
	}
	cv_.notify_one();
}

std::size_t ConcurrencyLimiter::GetCapacity() const noexcept
{
	return capacity_;
}

std::size_t ConcurrencyLimiter::GetInUse() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return in_use_;
}

std::size_t ConcurrencyLimiter::GetPeak() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return peak_;
}
