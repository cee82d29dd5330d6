#include "vox/nbt/tag.hpp"
#include "vox/nbt/decode_error.hpp"

namespace vox::nbt {

const char* to_string(TagType type) noexcept {
    switch (type) {
        case TagType::End:       return "end";
        case TagType::Byte:      return "byte";
        case TagType::Short:     return "short";
        case TagType::Int:       return "int";
        case TagType::Long:      return "long";
        case TagType::Float:     return "float";
        case TagType::Double:    return "double";
        case TagType::ByteArray: return "byte_array";
        case TagType::String:    return "string";
        case TagType::List:      return "list";
        case TagType::Compound:  return "compound";
        case TagType::IntArray:  return "int_array";
        case TagType::LongArray: return "long_array";
    }
    return "unknown";
}

const char* to_string(DecodeErrc code) noexcept {
    switch (code) {
        case DecodeErrc::Truncated:         return "truncated";
        case DecodeErrc::UnknownTagType:    return "unknown_tag_type";
        case DecodeErrc::UnexpectedTagType: return "unexpected_tag_type";
        case DecodeErrc::NegativeLength:    return "negative_length";
        case DecodeErrc::DepthExceeded:     return "depth_exceeded";
        case DecodeErrc::SourceClosed:      return "source_closed";
        case DecodeErrc::ReadFailed:        return "read_failed";
        case DecodeErrc::OutOfMemory:       return "out_of_memory";
        case DecodeErrc::InternalFault:     return "internal_fault";
    }
    return "unknown";
}

} // namespace vox::nbt
