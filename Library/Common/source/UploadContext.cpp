#include "UploadContext.hpp"

#include <algorithm>

UploadContext::UploadContext(std::chrono::milliseconds timeout)
	: deadline_(Clock::now() + timeout)
{
}

void UploadContext::Cancel() noexcept
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		cancelled_.store(true, std::memory_order_release);
	}
	cv_.notify_all();
}

bool UploadContext::IsCancelled() const noexcept
{
	return cancelled_.load(std::memory_order_acquire) || IsExpired();
}

bool UploadContext::IsExpired() const noexcept
{
	return deadline_.has_value() && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> UploadContext::Remaining() const noexcept
{
	if (!deadline_)
		return std::nullopt;

	const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
	return std::max(left, std::chrono::milliseconds(0));
}

bool UploadContext::WaitFor(std::chrono::milliseconds duration) const
{
	if (IsCancelled())
		return false;

	if (duration.count() <= 0)
		return true;

	auto until = Clock::now() + duration;
	if (deadline_ && *deadline_ < until)
		until = *deadline_;

	std::unique_lock<std::mutex> lock(mutex_);
	cv_.wait_until(lock, until, [this] {
		return cancelled_.load(std::memory_order_acquire);
	});

	return !IsCancelled();
}
