#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "ConcurrencyLimiter.hpp"
#include "WorkerPool.hpp"

using namespace std::chrono_literals;

TEST_CASE("WorkerPool returns task results through futures")
{
	WorkerPool pool(3);
	REQUIRE(pool.Size() == 3);

	std::vector<std::future<int>> results;
	for (int i = 0; i < 10; ++i)
		results.push_back(pool.Submit([](int x) { return x * x; }, i));

	for (int i = 0; i < 10; ++i)
		REQUIRE(results[i].get() == i * i);
}

TEST_CASE("WorkerPool runs queued tasks before shutting down")
{
	std::atomic<int> done{0};
	{
		WorkerPool pool(2);
		for (int i = 0; i < 20; ++i)
			pool.Submit([&done] {
				std::this_thread::sleep_for(1ms);
				done++;
			});
	}

	REQUIRE(done == 20);
}

TEST_CASE("ConcurrencyLimiter capacity is at least one")
{
	ConcurrencyLimiter limiter(0);
	REQUIRE(limiter.GetCapacity() == 1);
}

TEST_CASE("ConcurrencyLimiter blocks at capacity")
{
	ConcurrencyLimiter limiter(2);
	UploadContext context;

	REQUIRE(limiter.Acquire(context));
	REQUIRE(limiter.Acquire(context));
	REQUIRE(limiter.GetInUse() == 2);

	std::atomic<bool> acquired{false};
	std::thread waiter([&] {
		limiter.Acquire();
		acquired = true;
	});

	std::this_thread::sleep_for(50ms);
	REQUIRE_FALSE(acquired);

	limiter.Release();
	waiter.join();

	REQUIRE(acquired);
	REQUIRE(limiter.GetInUse() == 2);
	REQUIRE(limiter.GetPeak() == 2);
}

TEST_CASE("ConcurrencyLimiter gives up when the context is cancelled")
{
	ConcurrencyLimiter limiter(1);
	UploadContext context;

	REQUIRE(limiter.Acquire(context));

	std::thread canceller([&context] {
		std::this_thread::sleep_for(30ms);
		context.Cancel();
	});

	REQUIRE_FALSE(limiter.Acquire(context));
	canceller.join();

	REQUIRE(limiter.GetInUse() == 1);
}

TEST_CASE("ConcurrencyLimiter bounds concurrent work")
{
	ConcurrencyLimiter limiter(3);
	WorkerPool pool(8);

	std::atomic<int> running{0};
	std::atomic<int> peak{0};
	std::vector<std::future<void>> tasks;

	for (int i = 0; i < 24; ++i) {
		limiter.Acquire();
		tasks.push_back(pool.Submit([&] {
			const int now = ++running;
			int seen = peak.load();
			while (now > seen && !peak.compare_exchange_weak(seen, now))
				;

			std::this_thread::sleep_for(2ms);
			running--;
			limiter.Release();
		}));
	}

	for (auto& t : tasks)
		t.wait();

	REQUIRE(peak <= 3);
	REQUIRE(limiter.GetPeak() <= 3);
	REQUIRE(limiter.GetInUse() == 0);
}
