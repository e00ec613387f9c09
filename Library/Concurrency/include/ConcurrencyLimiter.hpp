#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

#include "UploadContext.hpp"

// Counting semaphore with a fixed number of slots.
class ConcurrencyLimiter
{
public:
	ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
	ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

public:
	explicit ConcurrencyLimiter(std::size_t capacity);

public:
	// Blocks until a slot is free. Returns false, without taking a slot,
	// if the context is cancelled first.
	bool Acquire(const UploadContext& context);
	void Acquire();
	void Release() noexcept;

	std::size_t GetCapacity() const noexcept;
	std::size_t GetInUse() const;

	// Highest number of slots held at the same time.
	std::size_t GetPeak() const;

private:
	const std::size_t capacity_;
	std::size_t in_use_ = 0;
	std::size_t peak_ = 0;

	mutable std::mutex mutex_;
	std::condition_variable cv_;
};
