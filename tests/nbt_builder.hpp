#pragma once
/**
 * @file nbt_builder.hpp
 * @brief Test helper that writes big-endian NBT bytes by hand.
 *
 * Calls mirror the stream layout: begin_compound()/end() bracket a compound,
 * leaf writers emit type id, name and payload in one call.
 */

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "vox/nbt/byte_source.hpp"
#include "vox/nbt/tag.hpp"

namespace vox::test {

class NbtBuilder {
public:
  using TagType = nbt::TagType;

  NbtBuilder& begin_compound(std::string_view name) {
    header(TagType::Compound, name);
    return *this;
  }

  /// Close the innermost compound.
  NbtBuilder& end() {
    u8(0);
    return *this;
  }

  NbtBuilder& byte_tag(std::string_view name, std::int8_t v) {
    header(TagType::Byte, name);
    u8(static_cast<std::uint8_t>(v));
    return *this;
  }

  NbtBuilder& int_tag(std::string_view name, std::int32_t v) {
    header(TagType::Int, name);
    be32(static_cast<std::uint32_t>(v));
    return *this;
  }

  NbtBuilder& long_tag(std::string_view name, std::int64_t v) {
    header(TagType::Long, name);
    be32(static_cast<std::uint32_t>(static_cast<std::uint64_t>(v) >> 32));
    be32(static_cast<std::uint32_t>(v));
    return *this;
  }

  NbtBuilder& string_tag(std::string_view name, std::string_view v) {
    header(TagType::String, name);
    str(v);
    return *this;
  }

  NbtBuilder& int_array(std::string_view name, const std::vector<std::int32_t>& v) {
    header(TagType::IntArray, name);
    be32(static_cast<std::uint32_t>(v.size()));
    for (auto x : v) be32(static_cast<std::uint32_t>(x));
    return *this;
  }

  /// List of ints.
  NbtBuilder& int_list(std::string_view name, const std::vector<std::int32_t>& v) {
    header(TagType::List, name);
    u8(static_cast<std::uint8_t>(TagType::Int));
    be32(static_cast<std::uint32_t>(v.size()));
    for (auto x : v) be32(static_cast<std::uint32_t>(x));
    return *this;
  }

  /// Header of a list of @p count compounds; follow with count x (fields..., end()).
  NbtBuilder& begin_compound_list(std::string_view name, std::int32_t count) {
    header(TagType::List, name);
    u8(static_cast<std::uint8_t>(TagType::Compound));
    be32(static_cast<std::uint32_t>(count));
    return *this;
  }

  /// Raw escape hatch for malformed input.
  NbtBuilder& raw_u8(std::uint8_t v) { u8(v); return *this; }
  NbtBuilder& raw_be32(std::uint32_t v) { be32(v); return *this; }
  NbtBuilder& raw_str(std::string_view v) { str(v); return *this; }

  const std::vector<std::uint8_t>& bytes() const noexcept { return out_; }

  /// Drop the last @p n bytes.
  NbtBuilder& truncate(std::size_t n) {
    out_.resize(out_.size() > n ? out_.size() - n : 0);
    return *this;
  }

  std::unique_ptr<nbt::MemoryByteSource> source() const {
    return nbt::MemoryByteSource::from_bytes(std::span<const std::uint8_t>(out_));
  }

private:
  void header(TagType t, std::string_view name) {
    u8(static_cast<std::uint8_t>(t));
    str(name);
  }
  void u8(std::uint8_t v) { out_.push_back(v); }
  void be16(std::uint16_t v) {
    out_.push_back(static_cast<std::uint8_t>(v >> 8));
    out_.push_back(static_cast<std::uint8_t>(v));
  }
  void be32(std::uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) out_.push_back(static_cast<std::uint8_t>(v >> shift));
  }
  void str(std::string_view s) {
    be16(static_cast<std::uint16_t>(s.size()));
    out_.insert(out_.end(), s.begin(), s.end());
  }

  std::vector<std::uint8_t> out_;
};

} // namespace vox::test
