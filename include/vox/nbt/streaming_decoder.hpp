#pragma once
/**
 * @file streaming_decoder.hpp
 * @brief Depth-first visitor walk over one serialized tag tree.
 *
 * Protocol:
 *  - One root node is produced; it must be a compound.
 *  - Pre-order walk: on_compound(name, contents, depth) fires before the
 *    compound's children are visited; list children fire on_list.
 *  - Any callback returning false stops the walk at once; parse() returns
 *    normally and on_error is not called.
 *  - Decode faults (and exceptions thrown by callbacks) are reported once
 *    through on_error; nothing escapes parse().
 *  - The byte source is closed on every exit path.
 *
 * A decoder is single-threaded; use one instance per source.
 */

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include "vox/nbt/byte_source.hpp"
#include "vox/nbt/decode_error.hpp"
#include "vox/nbt/tag.hpp"
#include "vox/nbt/tag_reader.hpp"
#include "vox/obs/observability.hpp"

namespace vox::nbt {

    /** @class TagVisitor
     *  @brief Callbacks invoked by StreamingTagDecoder::parse().
     */
    class TagVisitor {
    public:
        virtual ~TagVisitor() = default;

        /// @return false to stop the traversal.
        virtual bool on_compound(std::string_view name, const Compound& compound, std::size_t depth) = 0;

        /// @return false to stop the traversal.
        virtual bool on_list(std::string_view /*name*/, const List& /*list*/, std::size_t /*depth*/) {
            return true;
        }

        /// Called at most once per parse().
        virtual void on_error(const DecodeError& /*error*/) {}
    };

    /**
     * @brief Forwards compounds that follow the chunk section naming
     *        convention ("sections", "section_<n>") to a handler.
     */
    class SectionVisitor final : public TagVisitor {
    public:
        using Handler = std::function<void(std::string_view name, const Compound&)>;

        explicit SectionVisitor(Handler handler) : handler_(std::move(handler)) {}

        static bool is_section_name(std::string_view name) noexcept {
            return name == "sections" || name.starts_with("section_");
        }

        bool on_compound(std::string_view name, const Compound& compound, std::size_t) override {
            if (is_section_name(name)) handler_(name, compound);
            return true;
        }

    private:
        Handler handler_;
    };

    /// @brief Builds the node producer for a source; defaults to NbtReader.
    using ReaderFactory = std::function<std::unique_ptr<NodeReader>(ByteSource&, const ReaderLimits&)>;

    struct DecoderOptions {
        ReaderLimits   limits{};
        ReaderFactory  reader_factory{};     ///< Empty: NbtReader
        obs::Observer* observer = nullptr;   ///< Receives a DecodeFailureEvent per error
    };

    class StreamingTagDecoder {
    public:
        explicit StreamingTagDecoder(std::unique_ptr<ByteSource> source, DecoderOptions opts = {});

        StreamingTagDecoder(const StreamingTagDecoder&)            = delete;
        StreamingTagDecoder& operator=(const StreamingTagDecoder&) = delete;

        /// Walk the tree, driving @p visitor. Closes the source before returning.
        void parse(TagVisitor& visitor);

        /// Parse, forwarding only section compounds to @p handler.
        void parse_chunk_sections(SectionVisitor::Handler handler);

        /**
         * @brief Extract the compound at a dotted path, e.g. "Level.Sections".
         *
         * Each path element must name a compound nested inside the compound
         * matched by the previous element; matching follows traversal order and
         * stops at the first full match.
         * @return The matched compound's contents, or nullopt on miss or error.
         */
        static std::optional<Compound> extract_by_path(std::unique_ptr<ByteSource> source,
                                                       std::string_view dotted_path,
                                                       DecoderOptions opts = {});

        const ByteSource* source() const noexcept { return source_.get(); }

    private:
        bool walk(std::string_view name, const Compound& compound, std::size_t depth, TagVisitor& visitor);
        void report(TagVisitor& visitor, const DecodeError& error);

        std::unique_ptr<ByteSource> source_;
        DecoderOptions              opts_;
    };

} // namespace vox::nbt
