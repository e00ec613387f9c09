#include "TokenCache.hpp"

#include "fmt/core.h"

namespace {
	std::string TokenPrefix(const std::string& token)
	{
		return token.size() <= 8 ? std::string("****") : token.substr(0, 8) + "...";
	}
}

TokenCache::TokenCache(RemoteApi& api, Options options, std::shared_ptr<spdlog::logger> logger)
	: api_(api)
	, options_(std::move(options))
	, logger_(logger ? std::move(logger) : spdlog::default_logger())
{
	if (options_.seeded_token && !options_.seeded_token->empty()) {
		token_.value = *options_.seeded_token;
		logger_->warn("using pre-seeded access token {} (debug mode)", TokenPrefix(token_.value));
	}
}

bool TokenCache::IsFresh(const Token& token, Clock::time_point now) const noexcept
{
	if (token.Empty())
		return false;

	if (!token.expires_at)
		return true;

	return now + options_.safety_margin < *token.expires_at;
}

std::tuple<bool, Token, TokenCache::Error> TokenCache::Get(bool force_refresh)
{
	std::uint64_t seen;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		seen = token_.generation;
	}

	return Acquire(force_refresh, seen, true);
}

std::tuple<bool, Token, TokenCache::Error> TokenCache::Get(bool force_refresh, std::uint64_t rejected_generation)
{
	return Acquire(force_refresh, rejected_generation, false);
}

Token TokenCache::Peek() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return token_;
}

void TokenCache::SetRefreshListener(RefreshListener listener)
{
	std::lock_guard<std::mutex> lock(mutex_);
	listener_ = std::move(listener);
}

TokenCache::Outcome TokenCache::Acquire(bool force_refresh, std::uint64_t seen_generation, bool reuse_fresh)
{
	std::promise<Outcome> promise;
	std::shared_future<Outcome> pending;
	bool leader = false;

	{
		std::lock_guard<std::mutex> lock(mutex_);

		if (!force_refresh && IsFresh(token_, Clock::now()))
			return { true, token_, NoUploadError() };

		// another caller refreshed after this one saw the token rejected
		if (force_refresh && !token_.Empty() && token_.generation > seen_generation)
			return { true, token_, NoUploadError() };

		// a forced caller without a rejected generation takes any fresh
		// token of known lifetime, so late arrivals reuse the last refresh
		if (force_refresh && reuse_fresh && token_.expires_at && IsFresh(token_, Clock::now()))
			return { true, token_, NoUploadError() };

		if (inflight_) {
			pending = *inflight_;
		} else {
			pending = promise.get_future().share();
			inflight_ = pending;
			leader = true;
		}
	}

	if (!leader)
		return pending.get();

	Outcome outcome = Refresh();

	RefreshListener listener;
	{
		std::lock_guard<std::mutex> lock(mutex_);

		if (std::get<0>(outcome)) {
			Token& fresh = std::get<1>(outcome);
			fresh.generation = token_.generation + 1;
			token_ = fresh;
			listener = listener_;
		}

		inflight_.reset();
	}

	promise.set_value(outcome);

	if (listener)
		listener(std::get<1>(outcome));

	return outcome;
}

TokenCache::Outcome TokenCache::Refresh()
{
	logger_->info("refreshing access token");

	try {
		const auto now = Clock::now();

		auto [ok, grant, err] = api_.RequestToken(options_.corp_id, options_.secret);
		if (!ok) {
			logger_->error("failed to refresh access token: {}", DescribeUploadError(err));
			return { false, Token{}, err };
		}

		if (grant.access_token.empty())
			return { false, Token{}, MakeUploadError(ErrorKind::RemoteRejected, -1, "identity endpoint returned an empty token") };

		Token token;
		token.value = std::move(grant.access_token);
		token.expires_at = now + grant.expires_in;

		logger_->info("access token refreshed: {} (expires in {}s)", TokenPrefix(token.value), grant.expires_in.count());

		return { true, std::move(token), NoUploadError() };
	}
	catch (const std::exception& e) {
		logger_->error("failed to refresh access token: {}", e.what());
		return { false, Token{}, MakeUploadError(ErrorKind::TransientNetwork, -1, fmt::format("token refresh failed: {}", e.what())) };
	}
}
