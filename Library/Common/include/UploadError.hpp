#pragma once

#include <string>

enum class ErrorKind {
	None = 0,
	TransientNetwork,
	AuthExpired,
	RemoteRejected,
	LocalIO,
	Cancelled
};

struct UploadError {
	ErrorKind kind = ErrorKind::None;
	int code = 0;
	std::string message;
};

const char* ErrorKindName(ErrorKind kind) noexcept;

UploadError MakeUploadError(ErrorKind kind, int code, std::string message);
UploadError NoUploadError();

// "<kind> (<code>): <message>"
std::string DescribeUploadError(const UploadError& error);
