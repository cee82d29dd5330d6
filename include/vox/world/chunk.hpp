#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace vox::world {

/**
 * @file chunk.hpp
 * @brief Chunk coordinate key and decoded block-data handle.
 *
 * ChunkBlocks is produced by the decode pipeline and shared read-only between
 * the grid, the cache and any geometry pass still holding it; the cache and
 * the pool only ever manipulate BlockHandle references, never the data.
 */

/// @brief 2D chunk coordinate on the world grid (chunk units, not blocks).
struct ChunkCoord final {
  std::int32_t x{0};
  std::int32_t z{0};

  friend bool operator==(const ChunkCoord&, const ChunkCoord&) = default;
};

/// @brief Hash for ChunkCoord (packs both axes into one 64-bit word).
struct ChunkCoordHash {
  std::size_t operator()(const ChunkCoord& c) const noexcept {
    const auto packed = (static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.x)) << 32) |
                        static_cast<std::uint32_t>(c.z);
    return std::hash<std::uint64_t>{}(packed);
  }
};

/**
 * @brief Decoded block data of one chunk column.
 *
 * Layout is section-major, y-z-x within a section, matching the decode order.
 */
struct ChunkBlocks final {
  std::int32_t               min_y{0};       ///< Lowest block y covered
  std::int32_t               height{0};      ///< Number of block layers
  std::vector<std::uint16_t> block_ids;      ///< Palette-resolved block ids
  std::vector<std::uint8_t>  block_data;     ///< Per-block metadata nibble
  std::vector<std::uint8_t>  biomes;         ///< Biome ids, one per column

  /// @brief Approximate heap footprint, used for cache sizing diagnostics.
  std::size_t byte_size() const noexcept {
    return block_ids.capacity() * sizeof(std::uint16_t) +
           block_data.capacity() + biomes.capacity();
  }
};

/// @brief Shared, immutable handle to decoded chunk data. Null means absent.
using BlockHandle = std::shared_ptr<const ChunkBlocks>;

} // namespace vox::world
