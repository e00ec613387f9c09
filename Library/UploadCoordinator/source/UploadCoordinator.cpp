#include "UploadCoordinator.hpp"

#include <future>
#include <system_error>
#include <utility>
#include <vector>

#include "fmt/core.h"

#include "Base64.hpp"
#include "ConcurrencyLimiter.hpp"
#include "FileStream.hpp"
#include "WorkerPool.hpp"

namespace fs = std::filesystem;

namespace {
	UploadError MakeErr(ErrorKind kind, int code, std::string message)
	{
		return MakeUploadError(kind, code, std::move(message));
	}

	UploadError CancelledErr(const UploadContext& context)
	{
		return MakeErr(ErrorKind::Cancelled, -1,
			       context.IsExpired() ? "upload deadline exceeded" : "upload cancelled");
	}

	UploadError Annotate(const UploadError& error, const std::string& where)
	{
		return MakeErr(error.kind, error.code, fmt::format("{}: {}", where, error.message));
	}
}

UploadCoordinator::UploadCoordinator(RemoteApi& api, TokenCache& tokens, Options options,
				     std::shared_ptr<spdlog::logger> logger)
	: api_(api)
	, tokens_(tokens)
	, options_(std::move(options))
	, logger_(logger ? std::move(logger) : spdlog::default_logger())
{
}

const char* UploadCoordinator::StateName(State state) noexcept
{
	switch (state) {
	case State::Idle:		return "Idle";
	case State::Hashing:		return "Hashing";
	case State::Initiating:		return "Initiating";
	case State::UploadingParts:	return "UploadingParts";
	case State::Finishing:		return "Finishing";
	case State::Done:		return "Done";
	case State::Failed:		return "Failed";
	}

	return "Unknown";
}

UploadCoordinator::State UploadCoordinator::GetState() const noexcept
{
	return state_.load();
}

void UploadCoordinator::SetStateListener(StateListener listener)
{
	std::lock_guard<std::mutex> lock(listener_mutex_);
	listener_ = std::move(listener);
}

void UploadCoordinator::Transition(State next)
{
	state_.store(next);
	logger_->debug("upload state -> {}", StateName(next));

	StateListener listener;
	{
		std::lock_guard<std::mutex> lock(listener_mutex_);
		listener = listener_;
	}

	if (listener)
		listener(next);
}

std::tuple<bool, UploadCoordinator::Result, UploadCoordinator::Error> UploadCoordinator::Fail(Error error)
{
	logger_->error("upload failed: {}", DescribeUploadError(error));
	Transition(State::Failed);

	return { false, Result{}, std::move(error) };
}

std::tuple<bool, UploadCoordinator::Result, UploadCoordinator::Error>
UploadCoordinator::Upload(const fs::path& path)
{
	UploadContext context;
	return Upload(path, context);
}

std::optional<std::string> UploadCoordinator::UploadOrNull(const fs::path& path)
{
	auto [ok, result, err] = Upload(path);
	if (!ok)
		return std::nullopt;

	return result.file_id;
}

std::tuple<bool, UploadCoordinator::Result, UploadCoordinator::Error>
UploadCoordinator::Upload(const fs::path& path, const UploadContext& context)
{
	std::lock_guard<std::mutex> guard(upload_mutex_);

	try {
		Result result;

		logger_->info("uploading {}", path.string());

		Transition(State::Hashing);
		auto [hash_ok, hashes, hash_err] = Hash(path, context);
		if (!hash_ok)
			return Fail(hash_err);

		if (hashes.block_hashes.empty())
			return Fail(MakeErr(ErrorKind::LocalIO, -1, fmt::format("{} is empty", path.string())));

		result.size = hashes.total_size;
		result.block_count = hashes.block_hashes.size();

		logger_->info("hashed {} bytes into {} block(s)", result.size, result.block_count);

		if (context.IsCancelled())
			return Fail(CancelledErr(context));

		Transition(State::Initiating);
		auto [init_ok, session, init_err] = Initiate(path, hashes, context);
		if (!init_ok)
			return Fail(init_err);

		if (session.hit_exist) {
			if (session.file_id.empty())
				return Fail(MakeErr(ErrorKind::RemoteRejected, -1, "dedup hit without a file id"));

			result.file_id = std::move(session.file_id);
			result.deduplicated = true;

			logger_->info("{} already stored remotely as {}", path.string(), result.file_id);
			Transition(State::Done);

			return { true, std::move(result), NoUploadError() };
		}

		if (session.upload_key.empty())
			return Fail(MakeErr(ErrorKind::RemoteRejected, -1, "initiate returned neither upload key nor file id"));

		Transition(State::UploadingParts);
		auto [parts_ok, uploaded, parts_err] = UploadParts(path, session.upload_key, result.block_count, context);
		if (!parts_ok)
			return Fail(parts_err);

		result.parts_uploaded = uploaded;

		if (context.IsCancelled())
			return Fail(CancelledErr(context));

		Transition(State::Finishing);
		auto [finish_ok, file_id, finish_err] = Finish(session.upload_key, context);
		if (!finish_ok)
			return Fail(finish_err);

		result.file_id = std::move(file_id);

		logger_->info("uploaded {} as {}", path.string(), result.file_id);
		Transition(State::Done);

		return { true, std::move(result), NoUploadError() };
	}
	catch (const std::exception& e) {
		return Fail(MakeErr(ErrorKind::LocalIO, -1, fmt::format("unexpected failure: {}", e.what())));
	}
}

std::tuple<bool, BlockHasher::Result, UploadCoordinator::Error>
UploadCoordinator::Hash(const fs::path& path, const UploadContext& context)
{
	const std::size_t block_size = options_.block_size;

	std::future<std::tuple<bool, BlockHasher::Result, Error>> job;
	try {
		job = std::async(std::launch::async, [&path, &context, block_size]() {
			BlockHasher hasher(block_size);
			return hasher.HashFile(path, &context);
		});
	}
	catch (const std::system_error& e) {
		return { false, BlockHasher::Result{}, MakeErr(ErrorKind::LocalIO, e.code().value(),
							      fmt::format("cannot start hashing thread: {}", e.what())) };
	}

	return job.get();
}

template<class T, class Call>
std::tuple<bool, T, UploadCoordinator::Error>
UploadCoordinator::CallWithRetry(const char* phase, const UploadContext& context, Call&& call)
{
	const RetryPolicy& policy = options_.retry;

	int auth_retries = 0;
	int transient_retries = 0;
	bool force_refresh = false;
	std::uint64_t rejected_generation = 0;

	for (;;) {
		if (context.IsCancelled())
			return { false, T{}, Annotate(CancelledErr(context), phase) };

		auto [token_ok, token, token_err] = force_refresh
			? tokens_.Get(true, rejected_generation)
			: tokens_.Get();
		if (!token_ok)
			return { false, T{}, Annotate(token_err, fmt::format("{}: access token", phase)) };

		force_refresh = false;

		auto [ok, value, err] = call(token.value);
		if (ok)
			return { true, std::move(value), NoUploadError() };

		switch (err.kind) {
		case ErrorKind::AuthExpired:
			if (auth_retries >= policy.phase_auth_retries)
				return { false, T{}, Annotate(err, fmt::format("{} (after {} token refreshes)", phase, auth_retries)) };

			auth_retries++;
			force_refresh = true;
			rejected_generation = token.generation;

			logger_->warn("{}: access token rejected ({}), refreshing [{}/{}]",
				      phase, err.code, auth_retries, policy.phase_auth_retries);

			if (!context.WaitFor(policy.Backoff(auth_retries)))
				return { false, T{}, Annotate(CancelledErr(context), phase) };
			break;

		case ErrorKind::TransientNetwork:
			if (transient_retries >= policy.phase_transient_retries)
				return { false, T{}, Annotate(err, fmt::format("{} (after {} retries)", phase, transient_retries)) };

			transient_retries++;

			logger_->warn("{}: {}, retrying [{}/{}]", phase, err.message,
				      transient_retries, policy.phase_transient_retries);

			if (!context.WaitFor(policy.Backoff(transient_retries)))
				return { false, T{}, Annotate(CancelledErr(context), phase) };
			break;

		default:
			return { false, T{}, Annotate(err, phase) };
		}
	}
}

std::tuple<bool, RemoteApi::InitiateResponse, UploadCoordinator::Error>
UploadCoordinator::Initiate(const fs::path& path, const BlockHasher::Result& hashes, const UploadContext& context)
{
	RemoteApi::InitiateRequest request;
	request.space_id = options_.space_id;
	request.parent_id = options_.parent_id.empty() ? options_.space_id : options_.parent_id;
	request.file_name = path.filename().string();
	request.size = hashes.total_size;
	request.block_hashes = hashes.block_hashes;

	return CallWithRetry<RemoteApi::InitiateResponse>("initiate", context,
		[this, &request, &context](const std::string& token) {
			return api_.Initiate(token, request, context);
		});
}

std::tuple<bool, std::string, UploadCoordinator::Error>
UploadCoordinator::Finish(const std::string& upload_key, const UploadContext& context)
{
	auto [ok, file_id, err] = CallWithRetry<std::string>("finish", context,
		[this, &upload_key, &context](const std::string& token) {
			return api_.Finish(token, upload_key, context);
		});

	if (ok && file_id.empty())
		return { false, std::string(), MakeErr(ErrorKind::RemoteRejected, -1, "finish returned an empty file id") };

	return { ok, std::move(file_id), std::move(err) };
}

std::optional<UploadCoordinator::Error>
UploadCoordinator::UploadPart(const std::string& upload_key, std::uint64_t index,
			      const std::string& block, const UploadContext& context)
{
	const RetryPolicy& policy = options_.retry;
	const std::string where = fmt::format("block {}", index);

	RemoteApi::PartRequest request;
	request.upload_key = upload_key;
	request.index = index;
	request.content_base64 = Base64Encode(block);

	int attempts = 0;
	int auth_retries = 0;
	int transient_retries = 0;
	bool force_refresh = false;
	std::uint64_t rejected_generation = 0;

	Error last;

	while (attempts < policy.part_max_attempts) {
		if (context.IsCancelled())
			return Annotate(CancelledErr(context), where);

		auto [token_ok, token, token_err] = force_refresh
			? tokens_.Get(true, rejected_generation)
			: tokens_.Get();
		if (!token_ok)
			return Annotate(token_err, fmt::format("{}: access token", where));

		force_refresh = false;
		attempts++;

		std::optional<Error> err = api_.UploadPart(token.value, request, context);
		if (!err) {
			logger_->debug("{} uploaded ({} bytes, attempt {})", where, block.size(), attempts);
			return std::nullopt;
		}

		last = *err;

		switch (err->kind) {
		case ErrorKind::AuthExpired:
			if (auth_retries >= policy.part_auth_retries)
				return Annotate(last, fmt::format("{} (after {} token refreshes)", where, auth_retries));

			auth_retries++;
			force_refresh = true;
			rejected_generation = token.generation;

			if (attempts >= policy.part_max_attempts)
				break;

			logger_->warn("{}: access token rejected ({}), refreshing", where, err->code);

			if (!context.WaitFor(policy.Backoff(auth_retries)))
				return Annotate(CancelledErr(context), where);
			break;

		case ErrorKind::TransientNetwork:
			transient_retries++;

			if (attempts >= policy.part_max_attempts)
				break;

			logger_->warn("{}: {}, retrying [{}/{}]", where, err->message, attempts, policy.part_max_attempts);

			if (!context.WaitFor(policy.Backoff(transient_retries)))
				return Annotate(CancelledErr(context), where);
			break;

		default:
			return Annotate(last, where);
		}
	}

	return Annotate(last, fmt::format("{} (gave up after {} attempts)", where, attempts));
}

std::tuple<bool, std::size_t, UploadCoordinator::Error>
UploadCoordinator::UploadParts(const fs::path& path, const std::string& upload_key,
			       std::size_t block_count, const UploadContext& context)
{
	FileStream stream(path);
	if (auto err = stream.Open())
		return { false, 0, MakeErr(ErrorKind::LocalIO, err->code, err->message) };

	ConcurrencyLimiter limiter(options_.concurrency);

	std::atomic<bool> failed{false};
	std::atomic<std::size_t> uploaded{0};

	std::mutex error_mutex;
	std::optional<Error> first_error;

	auto record_failure = [&](Error error) {
		{
			std::lock_guard<std::mutex> lock(error_mutex);
			if (!first_error)
				first_error = std::move(error);
		}
		failed.store(true);
	};

	std::vector<std::future<void>> pending;
	std::uint64_t index = 0;

	{
		WorkerPool pool(limiter.GetCapacity());

		while (!failed.load()) {
			// a slot is taken before the block is read, so at most
			// `capacity` blocks are held in memory
			if (!limiter.Acquire(context)) {
				record_failure(CancelledErr(context));
				break;
			}

			if (failed.load()) {
				limiter.Release();
				break;
			}

			std::string block;
			auto [read_ok, read, read_err] = stream.ReadBlock(block, options_.block_size);
			if (!read_ok) {
				limiter.Release();
				record_failure(MakeErr(ErrorKind::LocalIO, read_err.code, read_err.message));
				break;
			}

			if (read == 0) {
				limiter.Release();
				break;
			}

			if (++index > block_count) {
				limiter.Release();
				record_failure(MakeErr(ErrorKind::LocalIO, -1,
						       fmt::format("{} grew after hashing", path.string())));
				break;
			}

			auto task = [this, &limiter, &failed, &uploaded, &record_failure, &upload_key, &context,
				     index, block = std::move(block)]() {
				std::optional<Error> err;

				if (!failed.load()) {
					try {
						err = UploadPart(upload_key, index, block, context);
					}
					catch (const std::exception& e) {
						err = MakeErr(ErrorKind::LocalIO, -1, fmt::format("block {}: {}", index, e.what()));
					}
				}

				if (err)
					record_failure(std::move(*err));
				else if (!failed.load())
					uploaded++;

				limiter.Release();
			};

			try {
				pending.push_back(pool.Submit(std::move(task)));
			}
			catch (const std::exception& e) {
				limiter.Release();
				record_failure(MakeErr(ErrorKind::LocalIO, -1, fmt::format("cannot schedule block {}: {}", index, e.what())));
				break;
			}
		}

		for (auto& part : pending)
			part.wait();
	}

	if (first_error)
		return { false, uploaded.load(), *first_error };

	if (index != block_count)
		return { false, uploaded.load(), MakeErr(ErrorKind::LocalIO, -1,
			 fmt::format("{} changed after hashing: {} of {} blocks read", path.string(), index, block_count)) };

	logger_->info("uploaded {} block(s), peak concurrency {}", uploaded.load(), limiter.GetPeak());

	return { true, uploaded.load(), NoUploadError() };
}
