#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

// Cancellation and deadline shared by every suspension point of one upload.
class UploadContext
{
public:
	using Clock = std::chrono::steady_clock;

public:
	UploadContext(const UploadContext&) = delete;
	UploadContext& operator=(const UploadContext&) = delete;

public:
	UploadContext() = default;
	explicit UploadContext(std::chrono::milliseconds timeout);

public:
	void Cancel() noexcept;

	// True once Cancel() was called or the deadline has passed.
	bool IsCancelled() const noexcept;
	bool IsExpired() const noexcept;

	// std::nullopt when there is no deadline.
	std::optional<std::chrono::milliseconds> Remaining() const noexcept;

	// Sleeps for `duration` unless cancelled first. Returns false if the
	// wait was cut short by cancellation or the deadline.
	bool WaitFor(std::chrono::milliseconds duration) const;

private:
	std::atomic<bool> cancelled_{false};
	std::optional<Clock::time_point> deadline_;

	mutable std::mutex mutex_;
	mutable std::condition_variable cv_;
};
