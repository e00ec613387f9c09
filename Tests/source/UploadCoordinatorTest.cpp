#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "FakeRemoteApi.hpp"
#include "TestFiles.hpp"
#include "TokenCache.hpp"
#include "UploadCoordinator.hpp"

using namespace std::chrono_literals;

namespace {
	constexpr std::size_t kMiB = 1024 * 1024;
	constexpr std::size_t kSmallBlock = 1024;

	TokenCache::Options Identity()
	{
		TokenCache::Options options;
		options.corp_id = "corp";
		options.secret = "secret";
		return options;
	}

	UploadCoordinator::Options Fast(std::size_t block_size = kSmallBlock)
	{
		UploadCoordinator::Options options;
		options.space_id = "space-1";
		options.block_size = block_size;
		options.retry.backoff = 1ms;
		return options;
	}

	struct Harness {
		FakeRemoteApi api;
		TokenCache tokens{ api, Identity() };
		TempDir dir;
	};
}

TEST_CASE("RetryPolicy backoff")
{
	RetryPolicy fixed;
	REQUIRE(fixed.Backoff(1) == 1000ms);
	REQUIRE(fixed.Backoff(4) == 1000ms);

	RetryPolicy exponential;
	exponential.backoff = 100ms;
	exponential.backoff_multiplier = 2.0;
	exponential.max_backoff = 500ms;

	REQUIRE(exponential.Backoff(1) == 100ms);
	REQUIRE(exponential.Backoff(2) == 200ms);
	REQUIRE(exponential.Backoff(3) == 400ms);
	REQUIRE(exponential.Backoff(4) == 500ms);
}

TEST_CASE("5 MiB file is uploaded as three 2 MiB parts")
{
	Harness h;
	const std::string content = RandomBytes(5 * kMiB, 21);
	const auto path = h.dir.Write("five.bin", content);

	UploadCoordinator coordinator(h.api, h.tokens, Fast(2 * kMiB));
	auto [ok, result, err] = coordinator.Upload(path);

	REQUIRE(ok);
	REQUIRE(result.file_id == "file-id-1");
	REQUIRE_FALSE(result.deduplicated);
	REQUIRE(result.size == 5 * kMiB);
	REQUIRE(result.block_count == 3);
	REQUIRE(result.parts_uploaded == 3);

	REQUIRE(h.api.initiate_calls == 1);
	REQUIRE(h.api.last_initiate.block_hashes.size() == 3);
	REQUIRE(h.api.last_initiate.block_hashes[2] == ReferenceSha1(content));
	REQUIRE(h.api.last_initiate.file_name == "five.bin");
	REQUIRE(h.api.last_initiate.size == 5 * kMiB);
	REQUIRE(h.api.last_initiate.space_id == "space-1");
	REQUIRE(h.api.last_initiate.parent_id == "space-1");

	REQUIRE(h.api.part_calls == 3);
	REQUIRE(h.api.parts.size() == 3);
	REQUIRE(h.api.parts.begin()->first == 1);
	REQUIRE(h.api.Assembled() == content);

	REQUIRE(h.api.finish_calls == 1);
	REQUIRE(h.api.token_calls == 1);
	REQUIRE(coordinator.GetState() == UploadCoordinator::State::Done);
}

TEST_CASE("Explicit parent folder is sent on initiate")
{
	Harness h;
	auto options = Fast();
	options.parent_id = "folder-9";

	UploadCoordinator coordinator(h.api, h.tokens, options);
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("a.txt", "hello"));

	REQUIRE(ok);
	REQUIRE(h.api.last_initiate.parent_id == "folder-9");
}

TEST_CASE("State listener sees every phase")
{
	Harness h;
	UploadCoordinator coordinator(h.api, h.tokens, Fast());

	std::vector<UploadCoordinator::State> states;
	coordinator.SetStateListener([&states](UploadCoordinator::State s) { states.push_back(s); });

	auto [ok, result, err] = coordinator.Upload(h.dir.Write("b.bin", RandomBytes(5000)));
	REQUIRE(ok);

	using S = UploadCoordinator::State;
	REQUIRE(states == std::vector<S>{ S::Hashing, S::Initiating, S::UploadingParts, S::Finishing, S::Done });
}

TEST_CASE("Dedup hit short-circuits the upload")
{
	Harness h;
	h.api.hit_exist = true;

	UploadCoordinator coordinator(h.api, h.tokens, Fast());
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("dup.bin", RandomBytes(10'000)));

	REQUIRE(ok);
	REQUIRE(result.deduplicated);
	REQUIRE(result.file_id == "existing-file-id");
	REQUIRE(result.parts_uploaded == 0);
	REQUIRE(h.api.part_calls == 0);
	REQUIRE(h.api.finish_calls == 0);
	REQUIRE(coordinator.GetState() == UploadCoordinator::State::Done);
}

TEST_CASE("Initiate recovers from two auth failures")
{
	Harness h;
	h.api.initiate_failures = { FakeRemoteApi::Auth(), FakeRemoteApi::Auth() };

	UploadCoordinator coordinator(h.api, h.tokens, Fast());
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("auth.bin", RandomBytes(3000)));

	REQUIRE(ok);
	REQUIRE(h.api.initiate_calls == 3);
	// one initial fetch plus two forced refreshes
	REQUIRE(h.api.token_calls == 3);
	REQUIRE(h.api.initiate_tokens == std::vector<std::string>{ "token-1", "token-2", "token-3" });
}

TEST_CASE("Initiate gives up after a third auth failure")
{
	Harness h;
	h.api.initiate_failures = { FakeRemoteApi::Auth(), FakeRemoteApi::Auth(), FakeRemoteApi::Auth() };

	UploadCoordinator coordinator(h.api, h.tokens, Fast());
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("auth.bin", RandomBytes(3000)));

	REQUIRE_FALSE(ok);
	REQUIRE(err.kind == ErrorKind::AuthExpired);
	REQUIRE(h.api.initiate_calls == 3);
	REQUIRE(h.api.part_calls == 0);
	REQUIRE(h.api.finish_calls == 0);
	REQUIRE(coordinator.GetState() == UploadCoordinator::State::Failed);
}

TEST_CASE("Initiate retries transient failures with its own budget")
{
	Harness h;

	SECTION("recovers")
	{
		h.api.initiate_failures = { FakeRemoteApi::Transient(), FakeRemoteApi::Transient() };

		UploadCoordinator coordinator(h.api, h.tokens, Fast());
		auto [ok, result, err] = coordinator.Upload(h.dir.Write("t.bin", "payload"));

		REQUIRE(ok);
		REQUIRE(h.api.initiate_calls == 3);
		REQUIRE(h.api.token_calls == 1);
	}

	SECTION("exhausts")
	{
		h.api.initiate_failures = { FakeRemoteApi::Transient(), FakeRemoteApi::Transient(), FakeRemoteApi::Transient() };

		UploadCoordinator coordinator(h.api, h.tokens, Fast());
		auto [ok, result, err] = coordinator.Upload(h.dir.Write("t.bin", "payload"));

		REQUIRE_FALSE(ok);
		REQUIRE(err.kind == ErrorKind::TransientNetwork);
		REQUIRE(h.api.initiate_calls == 3);
	}
}

TEST_CASE("Remote rejection at initiate is fatal")
{
	Harness h;
	h.api.initiate_failures = { FakeRemoteApi::Rejected() };

	UploadCoordinator coordinator(h.api, h.tokens, Fast());
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("r.bin", "payload"));

	REQUIRE_FALSE(ok);
	REQUIRE(err.kind == ErrorKind::RemoteRejected);
	REQUIRE(err.code == 45001);
	REQUIRE(h.api.initiate_calls == 1);
}

TEST_CASE("Local failures happen before any network call")
{
	Harness h;
	UploadCoordinator coordinator(h.api, h.tokens, Fast());

	SECTION("missing file")
	{
		auto [ok, result, err] = coordinator.Upload(h.dir.Path() / "missing.bin");
		REQUIRE_FALSE(ok);
		REQUIRE(err.kind == ErrorKind::LocalIO);
	}

	SECTION("empty file")
	{
		auto [ok, result, err] = coordinator.Upload(h.dir.Write("empty.bin", ""));
		REQUIRE_FALSE(ok);
		REQUIRE(err.kind == ErrorKind::LocalIO);
	}

	REQUIRE(h.api.token_calls == 0);
	REQUIRE(h.api.initiate_calls == 0);
	REQUIRE(coordinator.GetState() == UploadCoordinator::State::Failed);
}

TEST_CASE("Transient part failures are retried")
{
	Harness h;
	h.api.part_failures[2] = { FakeRemoteApi::Transient(), FakeRemoteApi::Transient() };

	const std::string content = RandomBytes(4 * kSmallBlock + 10);

	UploadCoordinator coordinator(h.api, h.tokens, Fast());
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("p.bin", content));

	REQUIRE(ok);
	REQUIRE(result.block_count == 5);
	REQUIRE(h.api.AttemptsFor(2) == 3);
	REQUIRE(h.api.part_calls == 7);
	REQUIRE(h.api.Assembled() == content);
}

TEST_CASE("A part gives up after five attempts")
{
	Harness h;
	h.api.part_failures[1] = std::deque<UploadError>(10, FakeRemoteApi::Transient());

	UploadCoordinator coordinator(h.api, h.tokens, Fast());
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("p.bin", RandomBytes(500)));

	REQUIRE_FALSE(ok);
	REQUIRE(err.kind == ErrorKind::TransientNetwork);
	REQUIRE(h.api.AttemptsFor(1) == 5);
	REQUIRE(h.api.finish_calls == 0);
}

TEST_CASE("Auth failure on a part forces one refresh")
{
	Harness h;
	h.api.part_failures[1] = { FakeRemoteApi::Auth() };

	UploadCoordinator coordinator(h.api, h.tokens, Fast());
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("p.bin", RandomBytes(800)));

	REQUIRE(ok);
	REQUIRE(h.api.token_calls == 2);
	REQUIRE(h.api.AttemptsFor(1) == 2);
	REQUIRE(h.api.part_tokens.back() == "token-2");
}

TEST_CASE("Auth failure on a part waits the backoff before retrying")
{
	Harness h;
	h.api.part_failures[1] = { FakeRemoteApi::Auth() };

	auto options = Fast();
	options.retry.backoff = 200ms;

	UploadCoordinator coordinator(h.api, h.tokens, options);

	const auto start = std::chrono::steady_clock::now();
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("pb.bin", RandomBytes(800)));

	REQUIRE(ok);
	REQUIRE(h.api.AttemptsFor(1) == 2);
	REQUIRE(std::chrono::steady_clock::now() - start >= 150ms);
}

TEST_CASE("Deadline during an auth backoff cancels the part")
{
	Harness h;
	h.api.part_failures[1] = { FakeRemoteApi::Auth() };

	auto options = Fast();
	options.retry.backoff = 10s;

	UploadCoordinator coordinator(h.api, h.tokens, options);
	UploadContext context(300ms);

	const auto start = std::chrono::steady_clock::now();
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("pc.bin", RandomBytes(800)), context);

	REQUIRE_FALSE(ok);
	REQUIRE(err.kind == ErrorKind::Cancelled);
	REQUIRE(h.api.AttemptsFor(1) == 1);
	REQUIRE(h.api.token_calls == 1);
	REQUIRE(h.api.finish_calls == 0);
	REQUIRE(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("A failed part stops further reads and skips finish")
{
	Harness h;
	h.api.part_hook = [](const RemoteApi::PartRequest& request, int) -> std::optional<UploadError> {
		if (request.index == 2)
			return FakeRemoteApi::Rejected();

		std::this_thread::sleep_for(100ms);
		return std::nullopt;
	};

	const std::size_t blocks = 20;
	UploadCoordinator coordinator(h.api, h.tokens, Fast());
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("ff.bin", RandomBytes(blocks * kSmallBlock)));

	REQUIRE_FALSE(ok);
	REQUIRE(err.kind == ErrorKind::RemoteRejected);
	REQUIRE(h.api.finish_calls == 0);
	REQUIRE(h.api.AttemptsFor(2) == 1);

	// only the blocks already holding a slot were sent
	REQUIRE(h.api.part_calls <= 4);
	REQUIRE(h.api.part_attempts.rbegin()->first <= 4);
	REQUIRE(coordinator.GetState() == UploadCoordinator::State::Failed);
}

TEST_CASE("No more than three parts are in flight")
{
	Harness h;
	h.api.part_delay = 20ms;

	UploadCoordinator coordinator(h.api, h.tokens, Fast());
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("c.bin", RandomBytes(12 * kSmallBlock)));

	REQUIRE(ok);
	REQUIRE(h.api.part_calls == 12);
	REQUIRE(h.api.peak_in_flight <= 3);
	REQUIRE(h.api.peak_in_flight >= 1);
}

TEST_CASE("Finish retries after an auth failure")
{
	Harness h;
	h.api.finish_failures = { FakeRemoteApi::Auth() };

	UploadCoordinator coordinator(h.api, h.tokens, Fast());
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("f.bin", RandomBytes(2000)));

	REQUIRE(ok);
	REQUIRE(h.api.finish_calls == 2);
	REQUIRE(h.api.token_calls == 2);
}

TEST_CASE("Cancelled upload fails with Cancelled")
{
	Harness h;
	UploadCoordinator coordinator(h.api, h.tokens, Fast());

	UploadContext context;
	context.Cancel();

	auto [ok, result, err] = coordinator.Upload(h.dir.Write("x.bin", RandomBytes(2000)), context);

	REQUIRE_FALSE(ok);
	REQUIRE(err.kind == ErrorKind::Cancelled);
	REQUIRE(h.api.initiate_calls == 0);
}

TEST_CASE("Deadline cuts a retry loop short")
{
	Harness h;
	h.api.initiate_failures = std::deque<UploadError>(3, FakeRemoteApi::Transient());

	auto options = Fast();
	options.retry.backoff = 10s;

	UploadCoordinator coordinator(h.api, h.tokens, options);
	UploadContext context(100ms);

	const auto start = std::chrono::steady_clock::now();
	auto [ok, result, err] = coordinator.Upload(h.dir.Write("d.bin", "payload"), context);

	REQUIRE_FALSE(ok);
	REQUIRE(err.kind == ErrorKind::Cancelled);
	REQUIRE(std::chrono::steady_clock::now() - start < 5s);
}

TEST_CASE("UploadOrNull keeps the nullable contract")
{
	Harness h;
	UploadCoordinator coordinator(h.api, h.tokens, Fast());

	REQUIRE(coordinator.UploadOrNull(h.dir.Write("ok.bin", "data")) == std::optional<std::string>("file-id-1"));
	REQUIRE_FALSE(coordinator.UploadOrNull(h.dir.Path() / "missing.bin").has_value());
}
