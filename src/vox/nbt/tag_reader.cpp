/**
 * @file tag_reader.cpp
 * @brief Buffered big-endian NBT node reader.
 */
#include "vox/nbt/tag_reader.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <type_traits>
#include <utility>
#include <vector>

namespace vox::nbt {

namespace {

/// Largest element count reserved ahead of the bytes that back it.
constexpr std::size_t kGrowStep = 4096;

template <class U>
U from_big_endian(const std::byte* p) noexcept {
    U v = 0;
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        v = static_cast<U>((v << 8) | static_cast<U>(std::to_integer<std::uint8_t>(p[i])));
    }
    return v;
}

} // namespace

NbtReader::NbtReader(ByteSource& source, ReaderLimits limits)
    : source_(source),
      limits_(limits),
      buf_(std::max<std::size_t>(limits.buffer_bytes, 16))
{
}

DecodeError NbtReader::error(DecodeErrc code, std::string detail) const {
    return DecodeError{code, consumed_, std::move(detail)};
}

NbtReader::Result<std::size_t> NbtReader::fill() {
    auto got = source_.read(std::span<std::byte>(buf_.data(), buf_.size()));
    if (!got) {
        DecodeError e = std::move(got.error());
        e.offset = consumed_;
        return vox_detail::unexpected<DecodeError>(std::move(e));
    }
    pos_ = 0;
    end_ = *got;
    return *got;
}

NbtReader::Result<bool> NbtReader::read_exact(std::byte* dst, std::size_t n) {
    while (n > 0) {
        if (pos_ == end_) {
            auto got = fill();
            if (!got) return vox_detail::unexpected<DecodeError>(std::move(got.error()));
            if (*got == 0) {
                return vox_detail::unexpected<DecodeError>(
                    error(DecodeErrc::Truncated, "stream ended " + std::to_string(n) + " bytes short"));
            }
        }
        const std::size_t take = std::min(n, end_ - pos_);
        std::memcpy(dst, buf_.data() + pos_, take);
        pos_ += take;
        consumed_ += take;
        dst += take;
        n -= take;
    }
    return true;
}

template <class T>
NbtReader::Result<T> NbtReader::read_be() {
    std::byte raw[sizeof(T)];
    if (auto ok = read_exact(raw, sizeof(T)); !ok) {
        return vox_detail::unexpected<DecodeError>(std::move(ok.error()));
    }
    if constexpr (std::is_same_v<T, float>) {
        return std::bit_cast<float>(from_big_endian<std::uint32_t>(raw));
    } else if constexpr (std::is_same_v<T, double>) {
        return std::bit_cast<double>(from_big_endian<std::uint64_t>(raw));
    } else {
        using U = std::make_unsigned_t<T>;
        return static_cast<T>(from_big_endian<U>(raw));
    }
}

NbtReader::Result<TagType> NbtReader::read_type() {
    auto id = read_be<std::uint8_t>();
    if (!id) return vox_detail::unexpected<DecodeError>(std::move(id.error()));
    if (*id > kMaxTagType) {
        return vox_detail::unexpected<DecodeError>(
            error(DecodeErrc::UnknownTagType, "tag type id " + std::to_string(*id)));
    }
    return static_cast<TagType>(*id);
}

NbtReader::Result<std::string> NbtReader::read_string() {
    auto len = read_be<std::uint16_t>();
    if (!len) return vox_detail::unexpected<DecodeError>(std::move(len.error()));
    std::vector<std::byte> raw(*len);
    if (auto ok = read_exact(raw.data(), raw.size()); !ok) {
        return vox_detail::unexpected<DecodeError>(std::move(ok.error()));
    }
    std::string s(raw.size(), '\0');
    std::transform(raw.begin(), raw.end(), s.begin(),
                   [](std::byte b) { return static_cast<char>(std::to_integer<unsigned char>(b)); });
    return s;
}

NbtReader::Result<std::int32_t> NbtReader::read_length() {
    auto len = read_be<std::int32_t>();
    if (!len) return len;
    if (*len < 0) {
        return vox_detail::unexpected<DecodeError>(
            error(DecodeErrc::NegativeLength, "length " + std::to_string(*len)));
    }
    return len;
}

template <class T>
NbtReader::Result<std::vector<T>> NbtReader::read_array() {
    auto len = read_length();
    if (!len) return vox_detail::unexpected<DecodeError>(std::move(len.error()));

    const auto n = static_cast<std::size_t>(*len);
    std::vector<T> out;
    out.reserve(std::min(n, kGrowStep));
    for (std::size_t i = 0; i < n; ++i) {
        auto v = read_be<T>();
        if (!v) return vox_detail::unexpected<DecodeError>(std::move(v.error()));
        out.push_back(*v);
    }
    return out;
}

NbtReader::Result<List> NbtReader::read_list(std::size_t depth) {
    auto elem = read_type();
    if (!elem) return vox_detail::unexpected<DecodeError>(std::move(elem.error()));
    auto len = read_length();
    if (!len) return vox_detail::unexpected<DecodeError>(std::move(len.error()));

    List list;
    list.element_type = *elem;
    if (*len == 0) return list;
    if (*elem == TagType::End) {
        return vox_detail::unexpected<DecodeError>(
            error(DecodeErrc::UnexpectedTagType, "non-empty list of end tags"));
    }

    const auto n = static_cast<std::size_t>(*len);
    list.elements.reserve(std::min(n, kGrowStep));
    for (std::size_t i = 0; i < n; ++i) {
        auto payload = read_payload(*elem, depth + 1);
        if (!payload) return vox_detail::unexpected<DecodeError>(std::move(payload.error()));
        list.elements.push_back(Tag{std::string{}, std::move(*payload)});
    }
    return list;
}

NbtReader::Result<Compound> NbtReader::read_compound(std::size_t depth) {
    Compound c;
    for (;;) {
        auto type = read_type();
        if (!type) return vox_detail::unexpected<DecodeError>(std::move(type.error()));
        if (*type == TagType::End) break;

        auto name = read_string();
        if (!name) return vox_detail::unexpected<DecodeError>(std::move(name.error()));
        auto payload = read_payload(*type, depth + 1);
        if (!payload) return vox_detail::unexpected<DecodeError>(std::move(payload.error()));
        c.entries.push_back(Tag{std::move(*name), std::move(*payload)});
    }
    return c;
}

NbtReader::Result<Payload> NbtReader::read_payload(TagType type, std::size_t depth) {
    auto wrap = [](auto&& r) -> Result<Payload> {
        if (!r) return vox_detail::unexpected<DecodeError>(std::move(r.error()));
        return Payload{std::move(*r)};
    };

    if ((type == TagType::Compound || type == TagType::List) && depth > limits_.max_depth) {
        return vox_detail::unexpected<DecodeError>(
            error(DecodeErrc::DepthExceeded, "nesting deeper than " + std::to_string(limits_.max_depth)));
    }

    switch (type) {
        case TagType::Byte:      return wrap(read_be<std::int8_t>());
        case TagType::Short:     return wrap(read_be<std::int16_t>());
        case TagType::Int:       return wrap(read_be<std::int32_t>());
        case TagType::Long:      return wrap(read_be<std::int64_t>());
        case TagType::Float:     return wrap(read_be<float>());
        case TagType::Double:    return wrap(read_be<double>());
        case TagType::ByteArray: return wrap(read_array<std::int8_t>());
        case TagType::String:    return wrap(read_string());
        case TagType::List:      return wrap(read_list(depth));
        case TagType::Compound:  return wrap(read_compound(depth));
        case TagType::IntArray:  return wrap(read_array<std::int32_t>());
        case TagType::LongArray: return wrap(read_array<std::int64_t>());
        case TagType::End:       break;
    }
    return vox_detail::unexpected<DecodeError>(
        error(DecodeErrc::UnexpectedTagType, "end tag where a payload was expected"));
}

vox_detail::expected<Tag, DecodeError> NbtReader::read_root() {
    auto type = read_type();
    if (!type) return vox_detail::unexpected<DecodeError>(std::move(type.error()));
    if (*type == TagType::End) {
        return vox_detail::unexpected<DecodeError>(
            error(DecodeErrc::UnexpectedTagType, "root is an end tag"));
    }
    auto name = read_string();
    if (!name) return vox_detail::unexpected<DecodeError>(std::move(name.error()));
    auto payload = read_payload(*type, 0);
    if (!payload) return vox_detail::unexpected<DecodeError>(std::move(payload.error()));
    return Tag{std::move(*name), std::move(*payload)};
}

} // namespace vox::nbt
