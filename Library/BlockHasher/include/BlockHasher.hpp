#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "openssl/sha.h"

#include "UploadContext.hpp"
#include "UploadError.hpp"

// One SHA-1 computation over a whole file, reported per block.
//
// Every block except the last is represented by the five SHA-1 registers
// after its bytes were absorbed, each register packed little-endian (the
// byte order the drive's own hashing module dumps). The last block is the
// regular big-endian SHA-1 digest of the entire content.
class BlockHasher
{
public:
	using Error = UploadError;

	static constexpr std::size_t kDefaultBlockSize = 2 * 1024 * 1024;
	static constexpr std::size_t kHexLength = 2 * SHA_DIGEST_LENGTH;

	struct Result {
		std::vector<std::string> block_hashes;
		std::uint64_t total_size = 0;
	};

public:
	explicit BlockHasher(std::size_t block_size = kDefaultBlockSize);

public:
	std::optional<Error> Initialize() noexcept;
	std::optional<Error> Update(const char* data, std::size_t size) noexcept;
	std::optional<Error> Update(std::string_view data) noexcept;

	// Register state after the bytes absorbed so far (little-endian words).
	// Bytes that do not yet fill a 64-byte round are not part of it.
	std::string StateHex() const;

	// Standard digest of everything absorbed so far. The running state is
	// left untouched.
	std::tuple<bool, std::string, Error> FinalHex() const noexcept;

public:
	std::tuple<bool, Result, Error> HashBytes(std::string_view data) noexcept;
	std::tuple<bool, Result, Error> HashFile(const std::filesystem::path& path,
						 const UploadContext* context = nullptr) noexcept;

private:
	std::optional<Error> AppendBlockHash(Result& result, bool last) noexcept;

private:
	std::size_t block_size_;
	SHA_CTX ctx_;
	bool initialized_ = false;
};
