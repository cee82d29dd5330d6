#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the cache, pool, decoder and buffer.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          config Loader (JSON files) in production deployments.
 */

#include <cstddef>
#include <cstdint>

namespace vox::config::constants {

// =====================
// Memory pressure tiers
// Utilization is used bytes / available bytes, a fraction in [0, 1].
// =====================
inline constexpr double PRESSURE_HIGH_RATIO      = 0.80; ///< Above this, shrink cache to low-water-mark
inline constexpr double PRESSURE_CRITICAL_RATIO  = 0.90; ///< Above this, shrink cache to a quarter
inline constexpr std::size_t CRITICAL_SHRINK_DIVISOR = 4; ///< target = max(1, size / divisor)
inline constexpr std::size_t LOW_WATER_DIVISOR       = 2; ///< low-water-mark = max(1, capacity / divisor)

// =====================
// Cache sizing
// =====================
inline constexpr std::size_t CACHE_DEFAULT_CAPACITY   = 200;  ///< Chunks to cache when not derived from memory
inline constexpr std::size_t CACHE_MIN_AUTO_CAPACITY  = 50;   ///< Lower clamp for memory-derived capacity
inline constexpr std::size_t CACHE_MAX_AUTO_CAPACITY  = 1000; ///< Upper clamp for memory-derived capacity
inline constexpr std::uint64_t CACHE_EST_CHUNK_BYTES  = 2ull * 1024 * 1024; ///< Estimated resident size per chunk
inline constexpr std::uint64_t CACHE_MEMORY_SHARE_DIV = 4;    ///< Use up to 1/4 of available memory

// =====================
// Pool sizing
// =====================
inline constexpr std::size_t POOL_DEFAULT_MAX_SIZE = 50; ///< Pooled wrappers kept for reuse

// =====================
// Decoder
// =====================
inline constexpr std::size_t DECODER_BUFFER_BYTES = 8192; ///< Read-ahead buffer per source
inline constexpr std::size_t DECODER_MAX_DEPTH    = 512;  ///< Nesting limit for compounds/lists

// =====================
// Buffer maintenance
// =====================
inline constexpr double MAINTENANCE_FLUSH_RATIO = 0.85; ///< Drop everything above this utilization

} // namespace vox::config::constants
