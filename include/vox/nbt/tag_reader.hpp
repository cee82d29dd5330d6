#pragma once
/**
 * @file tag_reader.hpp
 * @brief Node producers: materialize one named node from a ByteSource.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "vox/compat/expected.hpp"
#include "vox/config/constants.hpp"
#include "vox/nbt/byte_source.hpp"
#include "vox/nbt/decode_error.hpp"
#include "vox/nbt/tag.hpp"

namespace vox::nbt {

    /// @brief Bounds applied while reading untrusted input.
    struct ReaderLimits {
        std::size_t buffer_bytes = config::constants::DECODER_BUFFER_BYTES; ///< Read-ahead size
        std::size_t max_depth    = config::constants::DECODER_MAX_DEPTH;    ///< Compound/list nesting
    };

    /** @class NodeReader
     *  @brief Producer of one root node per call.
     */
    class NodeReader {
    public:
        virtual ~NodeReader() = default;

        /// Read the next named node (type id, name, payload).
        virtual vox_detail::expected<Tag, DecodeError> read_root() = 0;

        /// Bytes consumed from the source so far.
        virtual std::uint64_t offset() const noexcept = 0;
    };

    /**
     * @brief Big-endian NBT reader.
     *
     * Arrays and lists grow in bounded steps while reading, so a corrupted
     * length on a short stream fails with Truncated instead of allocating the
     * declared size up front.
     */
    class NbtReader final : public NodeReader {
    public:
        explicit NbtReader(ByteSource& source, ReaderLimits limits = {});

        vox_detail::expected<Tag, DecodeError> read_root() override;
        std::uint64_t offset() const noexcept override { return consumed_; }

    private:
        template <class T> using Result = vox_detail::expected<T, DecodeError>;

        Result<std::size_t> fill();
        Result<bool>        read_exact(std::byte* dst, std::size_t n);
        template <class T> Result<T> read_be();
        Result<TagType>     read_type();
        Result<std::string> read_string();
        Result<std::int32_t> read_length();
        template <class T> Result<std::vector<T>> read_array();
        Result<Payload>     read_payload(TagType type, std::size_t depth);
        Result<List>        read_list(std::size_t depth);
        Result<Compound>    read_compound(std::size_t depth);

        DecodeError error(DecodeErrc code, std::string detail) const;

        ByteSource&            source_;
        ReaderLimits           limits_;
        std::vector<std::byte> buf_;
        std::size_t            pos_{0};       ///< Next unread byte in buf_
        std::size_t            end_{0};       ///< One past the last valid byte in buf_
        std::uint64_t          consumed_{0};
    };

} // namespace vox::nbt
