#include "BlockHasher.hpp"

#include <algorithm>
#include <array>
#include <cstring>

#include "fmt/core.h"

#include "FileStream.hpp"

namespace {
	constexpr const char* kHex = "0123456789abcdef";

	BlockHasher::Error MakeError(ErrorKind kind, int code, std::string message)
	{
		return MakeUploadError(kind, code, std::move(message));
	}

	void AppendHexByte(std::string& out, std::uint8_t b)
	{
		out.push_back(kHex[(b >> 4) & 0xF]);
		out.push_back(kHex[b & 0xF]);
	}

	void AppendLittleEndianWord(std::string& out, SHA_LONG word)
	{
		AppendHexByte(out, static_cast<std::uint8_t>(word & 0xFF));
		AppendHexByte(out, static_cast<std::uint8_t>((word >> 8) & 0xFF));
		AppendHexByte(out, static_cast<std::uint8_t>((word >> 16) & 0xFF));
		AppendHexByte(out, static_cast<std::uint8_t>((word >> 24) & 0xFF));
	}
}

BlockHasher::BlockHasher(std::size_t block_size)
	: block_size_(block_size)
{
	std::memset(&ctx_, 0, sizeof(ctx_));
}

std::optional<BlockHasher::Error> BlockHasher::Initialize() noexcept
{
	if (block_size_ == 0)
		return MakeError(ErrorKind::LocalIO, -1, "block size must be positive");

	if (SHA1_Init(&ctx_) != 1)
		return MakeError(ErrorKind::LocalIO, -2, "SHA1_Init failed");

	initialized_ = true;

	return std::nullopt;
}

std::optional<BlockHasher::Error> BlockHasher::Update(const char* data, std::size_t size) noexcept
{
	if (!initialized_)
		return MakeError(ErrorKind::LocalIO, -3, "Update called before Initialize");

	if (!data && size != 0)
		return MakeError(ErrorKind::LocalIO, -3, "Update received null buffer with non-zero size");

	if (size == 0)
		return std::nullopt;

	if (SHA1_Update(&ctx_, data, size) != 1)
		return MakeError(ErrorKind::LocalIO, -4, "SHA1_Update failed");

	return std::nullopt;
}

std::optional<BlockHasher::Error> BlockHasher::Update(std::string_view data) noexcept
{
	return Update(data.data(), data.size());
}

std::string BlockHasher::StateHex() const
{
	std::string out;
	out.reserve(kHexLength);

	AppendLittleEndianWord(out, ctx_.h0);
	AppendLittleEndianWord(out, ctx_.h1);
	AppendLittleEndianWord(out, ctx_.h2);
	AppendLittleEndianWord(out, ctx_.h3);
	AppendLittleEndianWord(out, ctx_.h4);

	return out;
}

std::tuple<bool, std::string, BlockHasher::Error> BlockHasher::FinalHex() const noexcept
{
	if (!initialized_)
		return { false, {}, MakeError(ErrorKind::LocalIO, -3, "FinalHex called before Initialize") };

	// finalize a copy so the running computation stays usable
	SHA_CTX copy = ctx_;
	std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};

	if (SHA1_Final(digest.data(), &copy) != 1)
		return { false, {}, MakeError(ErrorKind::LocalIO, -5, "SHA1_Final failed") };

	std::string out;
	out.reserve(kHexLength);
	for (unsigned char b : digest)
		AppendHexByte(out, b);

	return { true, std::move(out), NoUploadError() };
}

std::optional<BlockHasher::Error> BlockHasher::AppendBlockHash(Result& result, bool last) noexcept
{
	try {
		if (!last) {
			result.block_hashes.push_back(StateHex());
			return std::nullopt;
		}

		auto [ok, digest, err] = FinalHex();
		if (!ok)
			return err;

		result.block_hashes.push_back(std::move(digest));
	}
	catch (const std::exception& e) {
		return MakeError(ErrorKind::LocalIO, -6, fmt::format("failed to record block hash: {}", e.what()));
	}

	return std::nullopt;
}

std::tuple<bool, BlockHasher::Result, BlockHasher::Error>
BlockHasher::HashBytes(std::string_view data) noexcept
{
	Result result;

	if (auto err = Initialize())
		return { false, Result{}, *err };

	std::size_t offset = 0;
	while (offset < data.size()) {
		const std::size_t n = std::min(block_size_, data.size() - offset);

		if (auto err = Update(data.substr(offset, n)))
			return { false, Result{}, *err };

		offset += n;

		if (auto err = AppendBlockHash(result, offset == data.size()))
			return { false, Result{}, *err };
	}

	result.total_size = data.size();

	return { true, std::move(result), NoUploadError() };
}

std::tuple<bool, BlockHasher::Result, BlockHasher::Error>
BlockHasher::HashFile(const std::filesystem::path& path, const UploadContext* context) noexcept
{
	Result result;

	if (auto err = Initialize())
		return { false, Result{}, *err };

	FileStream stream(path);
	if (auto err = stream.Open())
		return { false, Result{}, MakeError(ErrorKind::LocalIO, err->code, "failed to open file: " + err->message) };

	std::string block;
	while (true) {
		if (context && context->IsCancelled())
			return { false, Result{}, MakeError(ErrorKind::Cancelled, -1, "hashing cancelled") };

		auto [ok, n, err] = stream.ReadBlock(block, block_size_);
		if (!ok)
			return { false, Result{}, MakeError(ErrorKind::LocalIO, err.code, "failed to read file: " + err.message) };

		if (n <= 0)
			break;

		if (auto herr = Update(block))
			return { false, Result{}, *herr };

		if (auto herr = AppendBlockHash(result, stream.AtEnd()))
			return { false, Result{}, *herr };
	}

	result.total_size = stream.GetOffset();

	if (auto err = stream.Close())
		return { false, Result{}, MakeError(ErrorKind::LocalIO, err->code, "failed to close file: " + err->message) };

	if (result.total_size != stream.GetSize())
		return { false, Result{}, MakeError(ErrorKind::LocalIO, -7,
			fmt::format("file changed while hashing: expected {} bytes, read {}",
				    stream.GetSize(), result.total_size)) };

	return { true, std::move(result), NoUploadError() };
}
