#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

#include <spdlog/spdlog.h>

#include "RemoteApi.hpp"

struct Token {
	using Clock = std::chrono::system_clock;

	std::string value;
	std::optional<Clock::time_point> expires_at; // std::nullopt: unknown (pre-seeded)
	std::uint64_t generation = 0;		     // bumped by every successful refresh

	bool Empty() const noexcept { return value.empty(); }
};

// The one bearer credential of an identity.
//
// Get() returns the cached token while it is fresh. Refreshes are
// single-flight: callers that need a refresh while one is in progress wait
// for it and share its result instead of issuing their own request.
class TokenCache
{
public:
	using Error = UploadError;
	using Clock = Token::Clock;
	using RefreshListener = std::function<void(const Token&)>;

	struct Options {
		std::string corp_id;
		std::string secret;

		// tokens closer than this to their expiry are treated as stale
		std::chrono::seconds safety_margin{600};

		// debug credential with unknown expiry; fresh until force-refreshed
		std::optional<std::string> seeded_token;
	};

public:
	TokenCache(const TokenCache&) = delete;
	TokenCache& operator=(const TokenCache&) = delete;

public:
	TokenCache(RemoteApi& api, Options options, std::shared_ptr<spdlog::logger> logger = nullptr);

public:
	// force_refresh: the caller saw the current token rejected. A forced
	// call is satisfied without a network call if a refresh completed after
	// the call began, or if the cached token has a known expiry and is still
	// outside the safety margin.
	std::tuple<bool, Token, Error> Get(bool force_refresh = false);

	// Like Get(true), but "already refreshed" is judged only against the
	// generation of the token that was rejected; a fresh token of that same
	// generation is still replaced.
	std::tuple<bool, Token, Error> Get(bool force_refresh, std::uint64_t rejected_generation);

	// Snapshot of the cached token without any freshness check.
	Token Peek() const;

	void SetRefreshListener(RefreshListener listener);

private:
	using Outcome = std::tuple<bool, Token, Error>;

	bool IsFresh(const Token& token, Clock::time_point now) const noexcept;
	Outcome Acquire(bool force_refresh, std::uint64_t seen_generation, bool reuse_fresh);
	Outcome Refresh();

private:
	RemoteApi& api_;
	const Options options_;
	std::shared_ptr<spdlog::logger> logger_;

	mutable std::mutex mutex_;
	Token token_;
	std::optional<std::shared_future<Outcome>> inflight_;
	RefreshListener listener_;
};
