#include "FileStream.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <system_error>

FileStream::FileStream(const std::filesystem::path& path)
    : path_(path)
{
}

std::uint64_t FileStream::GetSize() const noexcept
{
    return size_;
}

std::uint64_t FileStream::GetOffset() const noexcept
{
    return offset_;
}

std::optional<FileStream::Error> FileStream::Open() noexcept
{
    if (stream_.is_open())
        stream_.close();

    stream_.clear();
    offset_ = 0;
    size_ = 0;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path_, ec))
        return Error{ ENOENT, "open: not a regular file, path=" + path_.string() };

    const auto size = std::filesystem::file_size(path_, ec);
    if (ec)
        return Error{ ec.value(), "open: " + ec.message() + ", path=" + path_.string() };

    errno = 0;
    stream_.open(path_, std::ios::in | std::ios::binary);
    if (!stream_.is_open() || stream_.fail() || stream_.bad())
        return stream_error(stream_, "open");

    size_ = static_cast<std::uint64_t>(size);

    return std::nullopt;
}

std::tuple<bool, std::streamsize, FileStream::Error>
FileStream::ReadBlock(std::string& block, std::size_t size) noexcept
{
    if (!stream_.is_open())
        return { false, 0, Error{ -1, "read: stream is not open"} };

    if (size == 0)
        return { false, 0, Error{ -1, "read: block size must be positive"} };

    try {
        block.resize(size);
    }
    catch (const std::exception& e) {
        return { false, 0, Error{ -1, std::string("read: ") + e.what() } };
    }

    errno = 0;
    stream_.read(block.data(), static_cast<std::streamsize>(size));
    const std::streamsize n = stream_.gcount();

    if (stream_.bad())
        return { false, n, stream_error(stream_, "read") };

    // eof (with failbit) is the only expected short read
    if (stream_.eof())
        stream_.clear(stream_.rdstate() & ~(std::ios::eofbit | std::ios::failbit));
    else if (stream_.fail())
        return { false, n, stream_error(stream_, "read") };

    block.resize(static_cast<std::size_t>(n));
    offset_ += static_cast<std::uint64_t>(n);

    return { true, n, Error{} };
}

bool FileStream::AtEnd() noexcept
{
    if (!stream_.is_open())
        return true;

    const bool at_end = stream_.peek() == std::ifstream::traits_type::eof();
    stream_.clear(stream_.rdstate() & ~(std::ios::eofbit | std::ios::failbit));

    return at_end;
}

std::optional<FileStream::Error> FileStream::Close() noexcept
{
    if (!stream_.is_open())
        return std::nullopt;

    stream_.close();

    if (stream_.fail() || stream_.bad())
        return stream_error(stream_, "close");

    return std::nullopt;
}

FileStream::Error FileStream::stream_error(const std::ios& stream, const char* context) const noexcept
{
    const auto state = stream.rdstate();

    std::ostringstream oss;
    oss << (context ? context : "stream")
        << ": iostate=0x" << std::hex << static_cast<unsigned int>(state);

    if ((state & std::ios::badbit) != 0)  oss << " (badbit)";
    if ((state & std::ios::failbit) != 0) oss << " (failbit)";
    if ((state & std::ios::eofbit) != 0)  oss << " (eofbit)";

    if (errno != 0)
        oss << ", errno=" << std::dec << errno << " (" << std::strerror(errno) << ")";

    oss << ", path=" << path_.string();

    return Error{ static_cast<int>(state), oss.str() };
}
