#include "UploadError.hpp"

#include "fmt/core.h"

const char* ErrorKindName(ErrorKind kind) noexcept
{
	switch (kind) {
	case ErrorKind::None:             return "none";
	case ErrorKind::TransientNetwork: return "transient-network";
	case ErrorKind::AuthExpired:      return "auth-expired";
	case ErrorKind::RemoteRejected:   return "remote-rejected";
	case ErrorKind::LocalIO:          return "local-io";
	case ErrorKind::Cancelled:        return "cancelled";
	}

	return "unknown";
}

UploadError MakeUploadError(ErrorKind kind, int code, std::string message)
{
	return UploadError{ kind, code, std::move(message) };
}

UploadError NoUploadError()
{
	return UploadError{ ErrorKind::None, 0, "" };
}

std::string DescribeUploadError(const UploadError& error)
{
	return fmt::format("{} ({}): {}", ErrorKindName(error.kind), error.code, error.message);
}
