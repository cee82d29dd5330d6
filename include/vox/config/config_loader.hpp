#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden by a JSON file.
 * @details All defaults reference named constants to avoid magic numbers.
 *
 * File format: one object per section, every key optional.
 * @code
 * {
 *   "cache":   { "capacity": 200, "high_watermark": 0.80,
 *                "critical_watermark": 0.90, "reclaim_hint": true },
 *   "pool":    { "max_size": 50 },
 *   "decoder": { "buffer_bytes": 8192, "max_depth": 512 },
 *   "buffer":  { "maintenance_ratio": 0.85 }
 * }
 * @endcode
 * `"capacity": "auto"` sizes the cache from physical memory.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "vox/cache/memory_pressure.hpp"
#include "vox/compat/expected.hpp"
#include "vox/config/constants.hpp"
#include "vox/nbt/tag_reader.hpp"

namespace vox::config {

    /** @struct CacheConfig
     *  @brief Capacity and pressure tiers of the chunk cache.
     */
    struct CacheConfig {
        std::size_t               capacity = constants::CACHE_DEFAULT_CAPACITY;
        cache::PressureThresholds thresholds{};
        bool                      reclaim_hint = true;  ///< malloc_trim after critical passes
    };

    /** @struct PoolConfig */
    struct PoolConfig {
        std::size_t max_size = constants::POOL_DEFAULT_MAX_SIZE;
    };

    /** @struct BufferConfig */
    struct BufferConfig {
        double maintenance_ratio = constants::MAINTENANCE_FLUSH_RATIO; ///< Flush everything above this
    };

    /** @struct PipelineConfig
     *  @brief Aggregate of sub-configs required by the chunk pipeline.
     */
    struct PipelineConfig {
        CacheConfig       cache;
        PoolConfig        pool;
        nbt::ReaderLimits decoder;
        BufferConfig      buffer;
    };

    /// Why a config file was rejected.
    enum class ConfigErrc : std::uint8_t {
        FileNotFound = 1,
        Malformed,       ///< Not JSON, or not an object where a section is expected
        UnknownKey,
        InvalidValue     ///< Unparsable or out of range
    };

    struct ConfigError {
        ConfigErrc  code{ConfigErrc::Malformed};
        std::string key;         ///< Dotted key at fault (`cache.capacity`), empty for document-level errors
        std::string message;
    };

    const char* to_string(ConfigErrc code) noexcept;

    /**
     * @brief Cache capacity for a memory budget: a quarter of @p available_bytes
     *        at an estimated 2 MiB per chunk, clamped to [50, 1000].
     */
    std::size_t optimal_cache_size(std::uint64_t available_bytes) noexcept;

    /** @class Loader
     *  @brief Source of pipeline configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Defaults from constants.hpp.
        static PipelineConfig defaults();

        /**
         * @brief Parse @p path on top of defaults().
         * @return PipelineConfig, or the first error found.
         */
        static vox_detail::expected<PipelineConfig, ConfigError> load_from_file(const std::string& path);

        /// Same as load_from_file() on in-memory JSON text.
        static vox_detail::expected<PipelineConfig, ConfigError> load_from_string(const std::string& text);
    };

} // namespace vox::config
