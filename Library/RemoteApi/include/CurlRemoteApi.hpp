#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "RemoteApi.hpp"

// RemoteApi over HTTPS with JSON bodies (libcurl + nlohmann::json).
//
// Each call uses its own easy handle, so one instance may be shared by
// concurrent part uploads.
class CurlRemoteApi final : public RemoteApi
{
public:
	struct Options {
		std::string base_url = "https://qyapi.weixin.qq.com/cgi-bin";
		std::chrono::seconds connect_timeout{10};
		std::chrono::seconds request_timeout{60};
		std::chrono::seconds part_timeout{120};
	};

	struct HttpResponse {
		long status = 0;
		std::string body;
	};

	using QueryParams = std::vector<std::pair<std::string, std::string>>;

public:
	CurlRemoteApi(const CurlRemoteApi&) = delete;
	CurlRemoteApi& operator=(const CurlRemoteApi&) = delete;

public:
	explicit CurlRemoteApi(Options options, std::shared_ptr<spdlog::logger> logger = nullptr);
	~CurlRemoteApi() override;

public:
	std::tuple<bool, TokenGrant, Error>
	RequestToken(const std::string& corp_id, const std::string& secret) override;

	std::tuple<bool, InitiateResponse, Error>
	Initiate(const std::string& access_token, const InitiateRequest& request, const UploadContext& context) override;

	std::optional<Error>
	UploadPart(const std::string& access_token, const PartRequest& request, const UploadContext& context) override;

	std::tuple<bool, std::string, Error>
	Finish(const std::string& access_token, const std::string& upload_key, const UploadContext& context) override;

public:
	static std::string BuildInitiateBody(const InitiateRequest& request);
	static std::string BuildPartBody(const PartRequest& request);
	static std::string BuildFinishBody(const std::string& upload_key);

	static std::tuple<bool, TokenGrant, Error> ParseTokenResponse(const HttpResponse& response) noexcept;
	static std::tuple<bool, InitiateResponse, Error> ParseInitiateResponse(const HttpResponse& response) noexcept;
	static std::optional<Error> ParsePartResponse(const HttpResponse& response) noexcept;
	static std::tuple<bool, std::string, Error> ParseFinishResponse(const HttpResponse& response) noexcept;

private:
	// Checks the HTTP status and the errcode/errmsg envelope.
	static std::tuple<bool, nlohmann::json, Error> ParseEnvelope(const HttpResponse& response) noexcept;

	std::tuple<bool, HttpResponse, Error> Perform(const char* method,
						      const std::string& path,
						      const QueryParams& params,
						      const std::string* body,
						      std::chrono::seconds timeout,
						      const UploadContext* context) noexcept;

private:
	const Options options_;
	std::shared_ptr<spdlog::logger> logger_;
	bool curl_ready_ = false;
};
