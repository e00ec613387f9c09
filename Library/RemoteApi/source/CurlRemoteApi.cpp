#include "CurlRemoteApi.hpp"

#include <algorithm>
#include <memory>

#include <curl/curl.h>

#include "fmt/core.h"

namespace {
	using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
	using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

	CurlRemoteApi::Error MakeErr(ErrorKind kind, int code, std::string message)
	{
		return MakeUploadError(kind, code, std::move(message));
	}

	size_t WriteBody(char* ptr, size_t size, size_t nmemb, void* userdata)
	{
		auto* body = static_cast<std::string*>(userdata);
		const size_t total = size * nmemb;

		try {
			body->append(ptr, total);
		}
		catch (const std::exception&) {
			// a short count makes curl fail the transfer with CURLE_WRITE_ERROR
			return 0;
		}

		return total;
	}

	int AbortIfCancelled(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
	{
		const auto* context = static_cast<const UploadContext*>(userdata);
		return (context && context->IsCancelled()) ? 1 : 0;
	}

	std::string Escape(CURL* curl, const std::string& value)
	{
		char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
		if (!escaped)
			return value;

		std::string out(escaped);
		curl_free(escaped);

		return out;
	}

	std::string TokenPrefix(const std::string& token)
	{
		return token.size() <= 8 ? std::string("****") : token.substr(0, 8) + "...";
	}
}

CurlRemoteApi::CurlRemoteApi(Options options, std::shared_ptr<spdlog::logger> logger)
	: options_(std::move(options))
	, logger_(logger ? std::move(logger) : spdlog::default_logger())
{
	const CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
	curl_ready_ = (rc == CURLE_OK);

	if (!curl_ready_)
		logger_->error("curl_global_init failed: {}", curl_easy_strerror(rc));
}

CurlRemoteApi::~CurlRemoteApi()
{
	if (curl_ready_)
		curl_global_cleanup();
}

std::tuple<bool, CurlRemoteApi::HttpResponse, CurlRemoteApi::Error>
CurlRemoteApi::Perform(const char* method,
		       const std::string& path,
		       const QueryParams& params,
		       const std::string* body,
		       std::chrono::seconds timeout,
		       const UploadContext* context) noexcept
{
	if (!curl_ready_)
		return { false, HttpResponse{}, MakeErr(ErrorKind::TransientNetwork, -1, "libcurl is not initialized") };

	if (context && context->IsCancelled())
		return { false, HttpResponse{}, MakeErr(ErrorKind::Cancelled, -1, fmt::format("{} {}: cancelled before send", method, path)) };

	try {
		CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
		if (!curl)
			return { false, HttpResponse{}, MakeErr(ErrorKind::TransientNetwork, -1, "curl_easy_init failed") };

		std::string url = options_.base_url + path;
		char separator = '?';
		for (const auto& [name, value] : params) {
			url += separator;
			url += name + "=" + Escape(curl.get(), value);
			separator = '&';
		}

		auto timeout_ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
		if (context) {
			if (auto remaining = context->Remaining())
				timeout_ms = std::min(timeout_ms, std::max(*remaining, std::chrono::milliseconds(1)));
		}

		HeaderList headers(curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);

		std::string received;

		curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
		curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
		curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
				 static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(options_.connect_timeout).count()));
		curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms.count()));
		curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &WriteBody);
		curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &received);
		curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
		curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &AbortIfCancelled);
		curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<UploadContext*>(context));

		if (body) {
			curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
			curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body->data());
			curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
		} else {
			curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
		}

		const auto start = std::chrono::steady_clock::now();
		const CURLcode rc = curl_easy_perform(curl.get());
		const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - start).count();

		if (rc != CURLE_OK) {
			logger_->debug("[http] {} {} curl={} latency_ms={}", method, path, static_cast<int>(rc), ms);

			if (rc == CURLE_ABORTED_BY_CALLBACK || (context && context->IsCancelled()))
				return { false, HttpResponse{}, MakeErr(ErrorKind::Cancelled, static_cast<int>(rc),
					fmt::format("{} {}: {}", method, path, context && context->IsExpired() ? "deadline exceeded" : "cancelled")) };

			return { false, HttpResponse{}, MakeErr(ErrorKind::TransientNetwork, static_cast<int>(rc),
				fmt::format("{} {}: {}", method, path, curl_easy_strerror(rc))) };
		}

		HttpResponse response;
		curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
		response.body = std::move(received);

		logger_->debug("[http] {} {} status={} bytes={} latency_ms={}",
			       method, path, response.status, response.body.size(), ms);

		return { true, std::move(response), NoUploadError() };
	}
	catch (const std::exception& e) {
		return { false, HttpResponse{}, MakeErr(ErrorKind::TransientNetwork, -1, fmt::format("{} {}: {}", method, path, e.what())) };
	}
}

std::tuple<bool, nlohmann::json, CurlRemoteApi::Error>
CurlRemoteApi::ParseEnvelope(const HttpResponse& response) noexcept
{
	if (response.status >= 500 || response.status == 429)
		return { false, nullptr, MakeErr(ErrorKind::TransientNetwork, static_cast<int>(response.status),
			fmt::format("HTTP {}", response.status)) };

	if (response.status != 200)
		return { false, nullptr, MakeErr(ErrorKind::RemoteRejected, static_cast<int>(response.status),
			fmt::format("HTTP {}", response.status)) };

	try {
		nlohmann::json json = nlohmann::json::parse(response.body, nullptr, false);
		if (json.is_discarded() || !json.is_object())
			return { false, nullptr, MakeErr(ErrorKind::TransientNetwork, -1, "malformed response body") };

		const int errcode = json.value("errcode", 0);
		if (errcode != 0)
			return { false, nullptr, ClassifyErrcode(errcode, json.value("errmsg", std::string{})) };

		return { true, std::move(json), NoUploadError() };
	}
	catch (const std::exception& e) {
		return { false, nullptr, MakeErr(ErrorKind::TransientNetwork, -1, fmt::format("unexpected response: {}", e.what())) };
	}
}

std::tuple<bool, RemoteApi::TokenGrant, CurlRemoteApi::Error>
CurlRemoteApi::ParseTokenResponse(const HttpResponse& response) noexcept
{
	auto [ok, json, err] = ParseEnvelope(response);
	if (!ok)
		return { false, TokenGrant{}, err };

	try {
		TokenGrant grant;

		const auto token = json.find("access_token");
		if (token == json.end() || !token->is_string() || token->get<std::string>().empty())
			return { false, TokenGrant{}, MakeErr(ErrorKind::RemoteRejected, -1, "response lacks access_token") };

		grant.access_token = token->get<std::string>();
		grant.expires_in = std::chrono::seconds(json.value("expires_in", 7200));

		return { true, std::move(grant), NoUploadError() };
	}
	catch (const std::exception& e) {
		return { false, TokenGrant{}, MakeErr(ErrorKind::TransientNetwork, -1, fmt::format("unexpected token response: {}", e.what())) };
	}
}

std::tuple<bool, RemoteApi::InitiateResponse, CurlRemoteApi::Error>
CurlRemoteApi::ParseInitiateResponse(const HttpResponse& response) noexcept
{
	auto [ok, json, err] = ParseEnvelope(response);
	if (!ok)
		return { false, InitiateResponse{}, err };

	try {
		InitiateResponse out;

		out.hit_exist = json.value("hit_exist", false);
		if (out.hit_exist) {
			out.file_id = json.value("fileid", std::string{});
			if (out.file_id.empty())
				return { false, InitiateResponse{}, MakeErr(ErrorKind::RemoteRejected, -1, "dedup hit without fileid") };

			return { true, std::move(out), NoUploadError() };
		}

		out.upload_key = json.value("upload_key", std::string{});
		if (out.upload_key.empty())
			return { false, InitiateResponse{}, MakeErr(ErrorKind::RemoteRejected, -1, "response lacks upload_key") };

		return { true, std::move(out), NoUploadError() };
	}
	catch (const std::exception& e) {
		return { false, InitiateResponse{}, MakeErr(ErrorKind::TransientNetwork, -1, fmt::format("unexpected init response: {}", e.what())) };
	}
}

std::optional<CurlRemoteApi::Error>
CurlRemoteApi::ParsePartResponse(const HttpResponse& response) noexcept
{
	auto [ok, json, err] = ParseEnvelope(response);
	if (!ok)
		return err;

	return std::nullopt;
}

std::tuple<bool, std::string, CurlRemoteApi::Error>
CurlRemoteApi::ParseFinishResponse(const HttpResponse& response) noexcept
{
	auto [ok, json, err] = ParseEnvelope(response);
	if (!ok)
		return { false, {}, err };

	try {
		std::string file_id = json.value("fileid", std::string{});
		if (file_id.empty())
			return { false, {}, MakeErr(ErrorKind::RemoteRejected, -1, "response lacks fileid") };

		return { true, std::move(file_id), NoUploadError() };
	}
	catch (const std::exception& e) {
		return { false, {}, MakeErr(ErrorKind::TransientNetwork, -1, fmt::format("unexpected finish response: {}", e.what())) };
	}
}

std::string CurlRemoteApi::BuildInitiateBody(const InitiateRequest& request)
{
	nlohmann::json j;

	j["spaceid"] = request.space_id;
	j["fatherid"] = request.parent_id;
	j["file_name"] = request.file_name;
	j["size"] = request.size;
	j["block_sha"] = request.block_hashes;
	j["skip_push_card"] = false;

	return j.dump();
}

std::string CurlRemoteApi::BuildPartBody(const PartRequest& request)
{
	nlohmann::json j;

	j["upload_key"] = request.upload_key;
	j["index"] = request.index;
	j["file_base64_content"] = request.content_base64;

	return j.dump();
}

std::string CurlRemoteApi::BuildFinishBody(const std::string& upload_key)
{
	nlohmann::json j;

	j["upload_key"] = upload_key;

	return j.dump();
}

std::tuple<bool, RemoteApi::TokenGrant, CurlRemoteApi::Error>
CurlRemoteApi::RequestToken(const std::string& corp_id, const std::string& secret)
{
	logger_->debug("requesting access token for {}", corp_id);

	auto [ok, response, err] = Perform("GET", "/gettoken",
					   { { "corpid", corp_id }, { "corpsecret", secret } },
					   nullptr, options_.request_timeout, nullptr);
	if (!ok)
		return { false, TokenGrant{}, err };

	return ParseTokenResponse(response);
}

std::tuple<bool, RemoteApi::InitiateResponse, CurlRemoteApi::Error>
CurlRemoteApi::Initiate(const std::string& access_token, const InitiateRequest& request, const UploadContext& context)
{
	std::string body;
	try {
		body = BuildInitiateBody(request);
	}
	catch (const std::exception& e) {
		return { false, InitiateResponse{}, MakeErr(ErrorKind::LocalIO, -1, fmt::format("failed to encode init request: {}", e.what())) };
	}

	logger_->debug("init: file={} size={} blocks={} token={}",
		       request.file_name, request.size, request.block_hashes.size(), TokenPrefix(access_token));

	auto [ok, response, err] = Perform("POST", "/wedrive/file_upload_init",
					   { { "access_token", access_token } },
					   &body, options_.request_timeout, &context);
	if (!ok)
		return { false, InitiateResponse{}, err };

	return ParseInitiateResponse(response);
}

std::optional<CurlRemoteApi::Error>
CurlRemoteApi::UploadPart(const std::string& access_token, const PartRequest& request, const UploadContext& context)
{
	std::string body;
	try {
		body = BuildPartBody(request);
	}
	catch (const std::exception& e) {
		return MakeErr(ErrorKind::LocalIO, -1, fmt::format("failed to encode part {}: {}", request.index, e.what()));
	}

	auto [ok, response, err] = Perform("POST", "/wedrive/file_upload_part",
					   { { "access_token", access_token } },
					   &body, options_.part_timeout, &context);
	if (!ok)
		return err;

	return ParsePartResponse(response);
}

std::tuple<bool, std::string, CurlRemoteApi::Error>
CurlRemoteApi::Finish(const std::string& access_token, const std::string& upload_key, const UploadContext& context)
{
	const std::string body = BuildFinishBody(upload_key);

	auto [ok, response, err] = Perform("POST", "/wedrive/file_upload_finish",
					   { { "access_token", access_token } },
					   &body, options_.request_timeout, &context);
	if (!ok)
		return { false, {}, err };

	return ParseFinishResponse(response);
}
