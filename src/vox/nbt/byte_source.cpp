/**
 * @file byte_source.cpp
 * @brief Memory and stdio-backed byte sources.
 */
#include "vox/nbt/byte_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace vox::nbt {

std::unique_ptr<MemoryByteSource> MemoryByteSource::from_bytes(std::span<const std::uint8_t> bytes) {
    std::vector<std::byte> data(bytes.size());
    std::transform(bytes.begin(), bytes.end(), data.begin(),
                   [](std::uint8_t b) { return static_cast<std::byte>(b); });
    return std::make_unique<MemoryByteSource>(std::move(data));
}

vox_detail::expected<std::size_t, DecodeError> MemoryByteSource::read(std::span<std::byte> dst) {
    if (!open_) {
        return vox_detail::unexpected<DecodeError>(
            DecodeError{DecodeErrc::SourceClosed, pos_, "read from closed memory source"});
    }
    const std::size_t n = std::min(dst.size(), data_.size() - pos_);
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), n, dst.begin());
    pos_ += n;
    return n;
}

vox_detail::expected<std::unique_ptr<FileByteSource>, DecodeError>
FileByteSource::open(const std::string& path) {
    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) {
        return vox_detail::unexpected<DecodeError>(
            DecodeError{DecodeErrc::ReadFailed, 0, "cannot open " + path + ": " + std::strerror(errno)});
    }
    return std::unique_ptr<FileByteSource>(new FileByteSource(f));
}

vox_detail::expected<std::size_t, DecodeError> FileByteSource::read(std::span<std::byte> dst) {
    if (!file_) {
        return vox_detail::unexpected<DecodeError>(
            DecodeError{DecodeErrc::SourceClosed, 0, "read from closed file source"});
    }
    const std::size_t n = std::fread(dst.data(), 1, dst.size(), file_);
    if (n < dst.size() && std::ferror(file_)) {
        return vox_detail::unexpected<DecodeError>(
            DecodeError{DecodeErrc::ReadFailed, 0, std::strerror(errno)});
    }
    return n;
}

void FileByteSource::close() noexcept {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

} // namespace vox::nbt
