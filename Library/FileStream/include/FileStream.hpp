#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <tuple>

// Sequential, read-only access to a local file in fixed-size blocks.
class FileStream {
public:
	struct Error {
		int code = 0;
		std::string message;
	};

public:
	FileStream(const FileStream&) = delete;
	FileStream& operator=(const FileStream&) = delete;

public:
	explicit FileStream(const std::filesystem::path& path);
	~FileStream() = default;

public:
	// Size of the file as seen when it was opened.
	std::uint64_t GetSize() const noexcept;

	// Total bytes handed out by ReadBlock() so far.
	std::uint64_t GetOffset() const noexcept;

public:
	std::optional<Error> Open() noexcept;

	// Fills `block` with up to `size` bytes. Short reads happen only at end
	// of file; a zero-length read means the file is exhausted.
	std::tuple<bool, std::streamsize, Error> ReadBlock(std::string& block, std::size_t size) noexcept;

	// True when no byte is left to read.
	bool AtEnd() noexcept;

	std::optional<Error> Close() noexcept;

private:
	Error stream_error(const std::ios& stream, const char* context) const noexcept;

private:
	const std::filesystem::path path_;
	std::ifstream stream_;

	std::uint64_t size_ = 0;
	std::uint64_t offset_ = 0;
};
