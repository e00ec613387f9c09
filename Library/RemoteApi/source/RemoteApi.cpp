#include "RemoteApi.hpp"

#include "fmt/core.h"

namespace {
	constexpr int kInvalidCredential = 40014;
	constexpr int kAccessTokenMissing = 41001;
	constexpr int kAccessTokenExpired = 42001;

	// "system busy, retry later"
	constexpr int kSystemBusy = -1;
}

bool RemoteApi::IsAuthFailureCode(int errcode) noexcept
{
	return errcode == kInvalidCredential
	    || errcode == kAccessTokenExpired
	    || errcode == kAccessTokenMissing;
}

RemoteApi::Error RemoteApi::ClassifyErrcode(int errcode, const std::string& errmsg)
{
	const std::string message = fmt::format("errcode={} errmsg={}", errcode, errmsg);

	if (IsAuthFailureCode(errcode))
		return MakeUploadError(ErrorKind::AuthExpired, errcode, message);

	if (errcode == kSystemBusy)
		return MakeUploadError(ErrorKind::TransientNetwork, errcode, message);

	return MakeUploadError(ErrorKind::RemoteRejected, errcode, message);
}
