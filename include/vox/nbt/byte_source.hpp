#pragma once
/**
 * @file byte_source.hpp
 * @brief Sequential, closable byte streams feeding the node reader.
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "vox/compat/expected.hpp"
#include "vox/nbt/decode_error.hpp"

namespace vox::nbt {

    /** @class ByteSource
     *  @brief Stream positioned at the start of one serialized tag tree.
     */
    class ByteSource {
    public:
        virtual ~ByteSource() = default;

        /// Read up to dst.size() bytes. 0 means end of stream.
        virtual vox_detail::expected<std::size_t, DecodeError> read(std::span<std::byte> dst) = 0;

        /// Release the underlying resource. Idempotent.
        virtual void close() noexcept = 0;

        virtual bool is_open() const noexcept = 0;
    };

    /// @brief Source over an owned in-memory buffer.
    class MemoryByteSource final : public ByteSource {
    public:
        explicit MemoryByteSource(std::vector<std::byte> data) noexcept : data_(std::move(data)) {}

        /// Convenience for raw octets (test fixtures, region payloads).
        static std::unique_ptr<MemoryByteSource> from_bytes(std::span<const std::uint8_t> bytes);

        vox_detail::expected<std::size_t, DecodeError> read(std::span<std::byte> dst) override;
        void close() noexcept override { open_ = false; }
        bool is_open() const noexcept override { return open_; }

    private:
        std::vector<std::byte> data_;
        std::size_t            pos_{0};
        bool                   open_{true};
    };

    /// @brief Source over a file opened in binary mode. Closes on destruction.
    class FileByteSource final : public ByteSource {
    public:
        /// Open @p path; ReadFailed if the file cannot be opened.
        static vox_detail::expected<std::unique_ptr<FileByteSource>, DecodeError>
        open(const std::string& path);

        ~FileByteSource() override { close(); }

        FileByteSource(const FileByteSource&)            = delete;
        FileByteSource& operator=(const FileByteSource&) = delete;

        vox_detail::expected<std::size_t, DecodeError> read(std::span<std::byte> dst) override;
        void close() noexcept override;
        bool is_open() const noexcept override { return file_ != nullptr; }

    private:
        explicit FileByteSource(std::FILE* f) noexcept : file_(f) {}

        std::FILE* file_{nullptr};
    };

} // namespace vox::nbt
