#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: cleanup/decode events, log lines, counters.
 * @details The default sink prints one JSON-ish line per event on stdout.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "vox/cache/memory_pressure.hpp"

namespace vox::obs {

    /// Severity of a free-form log line.
    enum class Level : std::uint8_t { Debug = 0, Info, Warn, Error };

    /** @struct Counters
     *  @brief Process-level counters for memory and decode diagnostics.
     */
    struct Counters {
        uint64_t cleanups{0};           ///< Cache cleanup passes observed
        uint64_t critical_cleanups{0};  ///< Passes that ran at critical tier
        uint64_t evicted{0};            ///< Entries evicted by cleanup passes
        uint64_t decode_failures{0};    ///< Decode errors reported
        uint64_t log_lines{0};          ///< Free-form lines emitted
    };

    /** @struct CleanupEvent
     *  @brief Payload describing one pressure-driven cleanup pass.
     */
    struct CleanupEvent {
        std::string_view component;       ///< Cache name, e.g. "chunk-cache"
        cache::PressureTier tier{cache::PressureTier::Normal};
        double      utilization{0.0};     ///< Sampled ratio that triggered the pass
        std::size_t size_before{0};
        std::size_t size_after{0};
        std::size_t evicted{0};
    };

    /** @struct DecodeFailureEvent
     *  @brief Payload describing a tag-tree decode failure.
     */
    struct DecodeFailureEvent {
        std::string_view error;           ///< Error code name
        std::string      detail;          ///< Human-readable reason
        std::uint64_t    offset{0};       ///< Byte offset where decoding stopped
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a cleanup pass.
        virtual void record(const CleanupEvent& e) = 0;
        /// Record a decode failure.
        virtual void record(const DecodeFailureEvent& e) = 0;
        /// Emit a free-form diagnostic line.
        virtual void log(Level level, std::string_view message) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide stdout observer. Lines below @p min_level are dropped.
    Observer* make_simple_observer();

    /// Adjust the threshold of the process-wide observer.
    void set_min_level(Level min_level);

    const char* to_string(Level level) noexcept;

} // namespace vox::obs
