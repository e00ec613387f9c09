#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "UploadContext.hpp"
#include "UploadError.hpp"

// Request/response surface of the remote drive. Implementations classify
// every failure into an ErrorKind but never retry on their own.
class RemoteApi
{
public:
	using Error = UploadError;

	struct TokenGrant {
		std::string access_token;
		std::chrono::seconds expires_in{7200};
	};

	struct InitiateRequest {
		std::string space_id;
		std::string parent_id;
		std::string file_name;
		std::uint64_t size = 0;
		std::vector<std::string> block_hashes;
	};

	struct InitiateResponse {
		bool hit_exist = false;
		std::string file_id;	// set on a dedup hit
		std::string upload_key; // set otherwise
	};

	struct PartRequest {
		std::string upload_key;
		std::uint64_t index = 0; // 1-based
		std::string content_base64;
	};

public:
	virtual ~RemoteApi() = default;

public:
	virtual std::tuple<bool, TokenGrant, Error>
	RequestToken(const std::string& corp_id, const std::string& secret) = 0;

	virtual std::tuple<bool, InitiateResponse, Error>
	Initiate(const std::string& access_token, const InitiateRequest& request, const UploadContext& context) = 0;

	virtual std::optional<Error>
	UploadPart(const std::string& access_token, const PartRequest& request, const UploadContext& context) = 0;

	// Returns the remote file id.
	virtual std::tuple<bool, std::string, Error>
	Finish(const std::string& access_token, const std::string& upload_key, const UploadContext& context) = 0;

public:
	// errcode values meaning the access token is invalid or expired
	static bool IsAuthFailureCode(int errcode) noexcept;

	// Maps a non-zero errcode to the error taxonomy.
	static Error ClassifyErrcode(int errcode, const std::string& errmsg);
};
