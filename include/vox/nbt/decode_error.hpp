#pragma once

#include <cstdint>
#include <string>

namespace vox::nbt {

/// Failure codes of the byte sources, the node reader and the decoder.
enum class DecodeErrc : std::uint8_t {
    Truncated = 1,      ///< Stream ended inside a node
    UnknownTagType,     ///< Type id outside [0, 12]
    UnexpectedTagType,  ///< Valid type where another was required (e.g. non-compound root)
    NegativeLength,     ///< Array/list length below zero
    DepthExceeded,      ///< Nesting deeper than the configured limit
    SourceClosed,       ///< Read after close()
    ReadFailed,         ///< I/O error from the underlying source
    OutOfMemory,        ///< Allocation failed while materializing a node
    InternalFault       ///< Exception raised by a visitor or node producer
};

/// Error value carried through expected<> and handed to TagVisitor::on_error.
struct DecodeError {
    DecodeErrc    code{DecodeErrc::InternalFault};
    std::uint64_t offset{0};   ///< Bytes consumed when the error was detected
    std::string   detail;
};

const char* to_string(DecodeErrc code) noexcept;

} // namespace vox::nbt
