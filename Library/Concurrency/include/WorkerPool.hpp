#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

// Fixed set of threads draining a FIFO task queue. The destructor runs
// every queued task before joining.
class WorkerPool
{
public:
	WorkerPool(const WorkerPool&) = delete;
	WorkerPool& operator=(const WorkerPool&) = delete;

public:
	explicit WorkerPool(size_t threads);
	~WorkerPool();

public:
	template<class F, class... Args>
	auto Submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))>;

	size_t Size() const noexcept;

private:
	std::vector<std::thread> workers_;
	std::queue<std::function<void()>> tasks_;

	std::mutex queue_mutex_;
	std::condition_variable condition_;
	bool stop_ = false;
};

template<class F, class... Args>
auto WorkerPool::Submit(F&& f, Args&&... args) -> std::future<decltype(f(args...))>
{
	using return_type = decltype(f(args...));

	auto task = std::make_shared<std::packaged_task<return_type()>>(
		std::bind(std::forward<F>(f), std::forward<Args>(args)...)
	);

	std::future<return_type> res = task->get_future();
	{
		std::unique_lock<std::mutex> lock(queue_mutex_);

		if (stop_)
			throw std::runtime_error("submit on stopped WorkerPool");

		tasks_.emplace([task]() { (*task)(); });
	}
	condition_.notify_one();

	return res;
}
