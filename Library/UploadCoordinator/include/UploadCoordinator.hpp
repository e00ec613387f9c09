#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

#include <spdlog/spdlog.h>

#include "BlockHasher.hpp"
#include "RemoteApi.hpp"
#include "RetryPolicy.hpp"
#include "TokenCache.hpp"
#include "UploadContext.hpp"

// Uploads one local file through the init / part / finish protocol.
//
//   Idle -> Hashing -> Initiating -> UploadingParts -> Finishing -> Done
//                          |
//                          +--(dedup hit)--> Done
//
// Any phase may end in Failed.
//
// Blocks are uploaded by a fixed pool of workers. The file is read one block
// ahead of a free slot, so no more than `concurrency` blocks are in memory.
// One instance runs one upload at a time; concurrent Upload() calls queue.
class UploadCoordinator
{
public:
	using Error = UploadError;

	enum class State {
		Idle = 0,
		Hashing,
		Initiating,
		UploadingParts,
		Finishing,
		Done,
		Failed
	};

	struct Options {
		std::string space_id;
		std::string parent_id;		// empty: the space root (space_id)
		std::size_t block_size = BlockHasher::kDefaultBlockSize;
		std::size_t concurrency = 3;
		RetryPolicy retry;
	};

	struct Result {
		std::string file_id;
		bool deduplicated = false;
		std::uint64_t size = 0;
		std::size_t block_count = 0;
		std::size_t parts_uploaded = 0;
	};

	using StateListener = std::function<void(State)>;

public:
	UploadCoordinator(const UploadCoordinator&) = delete;
	UploadCoordinator& operator=(const UploadCoordinator&) = delete;

public:
	UploadCoordinator(RemoteApi& api, TokenCache& tokens, Options options,
			  std::shared_ptr<spdlog::logger> logger = nullptr);

public:
	std::tuple<bool, Result, Error> Upload(const std::filesystem::path& path, const UploadContext& context);
	std::tuple<bool, Result, Error> Upload(const std::filesystem::path& path);

	// File id, or std::nullopt on any failure.
	std::optional<std::string> UploadOrNull(const std::filesystem::path& path);

	State GetState() const noexcept;
	void SetStateListener(StateListener listener);

	static const char* StateName(State state) noexcept;

private:
	std::tuple<bool, BlockHasher::Result, Error> Hash(const std::filesystem::path& path, const UploadContext& context);

	std::tuple<bool, RemoteApi::InitiateResponse, Error> Initiate(const std::filesystem::path& path,
								       const BlockHasher::Result& hashes,
								       const UploadContext& context);

	std::tuple<bool, std::size_t, Error> UploadParts(const std::filesystem::path& path,
							 const std::string& upload_key,
							 std::size_t block_count,
							 const UploadContext& context);

	std::optional<Error> UploadPart(const std::string& upload_key, std::uint64_t index,
					const std::string& block, const UploadContext& context);

	std::tuple<bool, std::string, Error> Finish(const std::string& upload_key, const UploadContext& context);

	// Runs `call(token)` with the Initiate/Finish retry policy.
	template<class T, class Call>
	std::tuple<bool, T, Error> CallWithRetry(const char* phase, const UploadContext& context, Call&& call);

	void Transition(State next);
	std::tuple<bool, Result, Error> Fail(Error error);

private:
	RemoteApi& api_;
	TokenCache& tokens_;
	const Options options_;
	std::shared_ptr<spdlog::logger> logger_;

	std::mutex upload_mutex_;
	std::atomic<State> state_{State::Idle};

	std::mutex listener_mutex_;
	StateListener listener_;
};
