#pragma once
/**
 * @file tag.hpp
 * @brief In-memory tag node: compound, list or leaf, each carrying a name.
 *
 * The variant alternatives follow the on-disk type ids, so
 * type() == TagType(value.index() + 1).
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vox::nbt {

/// @brief Tag type ids as they appear in the serialized stream.
enum class TagType : std::uint8_t {
    End = 0,
    Byte,
    Short,
    Int,
    Long,
    Float,
    Double,
    ByteArray,
    String,
    List,
    Compound,
    IntArray,
    LongArray
};

inline constexpr std::uint8_t kMaxTagType = static_cast<std::uint8_t>(TagType::LongArray);

const char* to_string(TagType type) noexcept;

struct Tag;

/// @brief Ordered named children. Lookup is linear; compounds are small.
struct Compound {
    std::vector<Tag> entries;

    /// First child named @p name, or nullptr.
    const Tag* find(std::string_view name) const noexcept;

    std::size_t size() const noexcept { return entries.size(); }
    bool empty() const noexcept { return entries.empty(); }
};

/// @brief Homogeneous sequence of unnamed elements.
struct List {
    TagType          element_type{TagType::End};
    std::vector<Tag> elements;

    std::size_t size() const noexcept { return elements.size(); }
    bool empty() const noexcept { return elements.empty(); }
};

using Payload = std::variant<
    std::int8_t,
    std::int16_t,
    std::int32_t,
    std::int64_t,
    float,
    double,
    std::vector<std::int8_t>,
    std::string,
    List,
    Compound,
    std::vector<std::int32_t>,
    std::vector<std::int64_t>>;

/// @brief One named node of the tag tree.
struct Tag {
    std::string name;
    Payload     value{};

    TagType type() const noexcept { return static_cast<TagType>(value.index() + 1); }

    /// @brief Typed access; nullptr if the payload holds another alternative.
    template <class T>
    const T* as() const noexcept { return std::get_if<T>(&value); }
};

inline const Tag* Compound::find(std::string_view name) const noexcept {
    for (const Tag& t : entries) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

} // namespace vox::nbt
