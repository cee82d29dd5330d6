/**
 * @file streaming_decoder.cpp
 * @brief Visitor walk, path extraction and scoped source release.
 */
#include "vox/nbt/streaming_decoder.hpp"

#include <exception>
#include <new>
#include <string>
#include <utility>
#include <vector>

namespace vox::nbt {

namespace {

/// Closes the source when the parse scope ends, however it ends.
class SourceCloser {
public:
    explicit SourceCloser(ByteSource* source) noexcept : source_(source) {}
    ~SourceCloser() { if (source_) source_->close(); }

    SourceCloser(const SourceCloser&)            = delete;
    SourceCloser& operator=(const SourceCloser&) = delete;

private:
    ByteSource* source_;
};

/// Matches a chain of nested compound names in traversal order.
class PathMatcher final : public TagVisitor {
public:
    explicit PathMatcher(std::string_view dotted) {
        std::size_t start = 0;
        for (;;) {
            const std::size_t dot = dotted.find('.', start);
            parts_.push_back(dotted.substr(start, dot - start));
            if (dot == std::string_view::npos) break;
            start = dot + 1;
        }
    }

    bool on_compound(std::string_view name, const Compound& compound, std::size_t depth) override {
        // Matches at depth >= this one are no longer ancestors of the current node.
        while (!matched_depths_.empty() && matched_depths_.back() >= depth) {
            matched_depths_.pop_back();
        }
        if (name != parts_[matched_depths_.size()]) {
            return true;
        }
        matched_depths_.push_back(depth);
        if (matched_depths_.size() == parts_.size()) {
            result_ = compound;
            return false;
        }
        return true;
    }

    std::optional<Compound> take() { return std::move(result_); }

private:
    std::vector<std::string_view> parts_;
    std::vector<std::size_t>      matched_depths_;
    std::optional<Compound>       result_;
};

} // namespace

StreamingTagDecoder::StreamingTagDecoder(std::unique_ptr<ByteSource> source, DecoderOptions opts)
    : source_(std::move(source)),
      opts_(std::move(opts))
{
}

void StreamingTagDecoder::parse(TagVisitor& visitor) {
    SourceCloser closer(source_.get());

    if (!source_) {
        report(visitor, DecodeError{DecodeErrc::SourceClosed, 0, "decoder has no source"});
        return;
    }

    std::optional<DecodeError> failure;
    std::uint64_t offset = 0;
    try {
        std::unique_ptr<NodeReader> reader = opts_.reader_factory
            ? opts_.reader_factory(*source_, opts_.limits)
            : std::make_unique<NbtReader>(*source_, opts_.limits);

        auto root = reader->read_root();
        offset = reader->offset();
        if (!root) {
            failure = std::move(root.error());
        } else if (const Compound* top = root->as<Compound>(); top == nullptr) {
            failure = DecodeError{DecodeErrc::UnexpectedTagType, offset,
                                  std::string("root is ") + to_string(root->type()) + ", expected compound"};
        } else {
            (void)walk(root->name, *top, 0, visitor);
        }
    } catch (const std::bad_alloc&) {
        failure = DecodeError{DecodeErrc::OutOfMemory, offset, "allocation failed while decoding"};
    } catch (const std::exception& e) {
        failure = DecodeError{DecodeErrc::InternalFault, offset, e.what()};
    } catch (...) {
        failure = DecodeError{DecodeErrc::InternalFault, offset, "non-standard exception"};
    }

    if (failure) {
        report(visitor, *failure);
    }
}

void StreamingTagDecoder::parse_chunk_sections(SectionVisitor::Handler handler) {
    SectionVisitor visitor(std::move(handler));
    parse(visitor);
}

bool StreamingTagDecoder::walk(std::string_view name, const Compound& compound,
                               std::size_t depth, TagVisitor& visitor) {
    if (!visitor.on_compound(name, compound, depth)) {
        return false;
    }
    for (const Tag& child : compound.entries) {
        if (const auto* sub = child.as<Compound>()) {
            if (!walk(child.name, *sub, depth + 1, visitor)) return false;
        } else if (const auto* list = child.as<List>()) {
            if (!visitor.on_list(child.name, *list, depth + 1)) return false;
        }
    }
    return true;
}

void StreamingTagDecoder::report(TagVisitor& visitor, const DecodeError& error) {
    if (opts_.observer) {
        opts_.observer->record(obs::DecodeFailureEvent{to_string(error.code), error.detail, error.offset});
    }
    try {
        visitor.on_error(error);
    } catch (const std::exception& e) {
        // on_error is the last stop; surface its own failure through the log only.
        if (opts_.observer) {
            opts_.observer->log(obs::Level::Error, std::string("decode error handler threw: ") + e.what());
        }
    } catch (...) {
        if (opts_.observer) {
            opts_.observer->log(obs::Level::Error, "decode error handler threw a non-standard exception");
        }
    }
}

std::optional<Compound> StreamingTagDecoder::extract_by_path(std::unique_ptr<ByteSource> source,
                                                             std::string_view dotted_path,
                                                             DecoderOptions opts) {
    if (dotted_path.empty()) {
        if (source) source->close();
        return std::nullopt;
    }
    PathMatcher matcher(dotted_path);
    StreamingTagDecoder decoder(std::move(source), std::move(opts));
    decoder.parse(matcher);
    return matcher.take();
}

} // namespace vox::nbt
