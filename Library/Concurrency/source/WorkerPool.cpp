#include "WorkerPool.hpp"

WorkerPool::WorkerPool(size_t threads)
{
	if (threads == 0)
		threads = 1;

	workers_.reserve(threads);
	for (size_t i = 0; i < threads; ++i) {
		workers_.emplace_back([this]() {
			for (;;) {
				std::function<void()> task;
				{
					std::unique_lock<std::mutex> lock(queue_mutex_);
					condition_.wait(lock, [this]() {
						return stop_ || !tasks_.empty();
					});

					if (stop_ && tasks_.empty())
						return;

					task = std::move(tasks_.front());
					tasks_.pop();
				}

				task();
			}
		});
	}
}

WorkerPool::~WorkerPool()
{
	{
		std::unique_lock<std::mutex> lock(queue_mutex_);
		stop_ = true;
	}
	condition_.notify_all();

	for (std::thread& worker : workers_)
		worker.join();
}

size_t WorkerPool::Size() const noexcept
{
	return workers_.size();
}
