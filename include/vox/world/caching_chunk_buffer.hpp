#pragma once
/**
 * @file caching_chunk_buffer.hpp
 * @brief Read-through chunk buffer: cache and wrapper pool in front of a ChunkGrid.
 */

#include <cstddef>
#include <string>

#include "vox/cache/memory_pressure.hpp"
#include "vox/cache/pressure_aware_cache.hpp"
#include "vox/config/config_loader.hpp"
#include "vox/mem/chunk_block_pool.hpp"
#include "vox/obs/observability.hpp"
#include "vox/world/chunk.hpp"
#include "vox/world/chunk_grid.hpp"

namespace vox::world {

    using ChunkCache = cache::PressureAwareCache<ChunkCoord, BlockHandle, ChunkCoordHash>;

    class CachingChunkBuffer {
    public:
        /**
         * @param grid      External chunk index (not owned, must outlive the buffer).
         * @param cfg       Cache, pool and maintenance settings.
         * @param pressure  Utilization source shared by cache and maintenance (may be null).
         * @param observer  Log sink (may be null).
         */
        CachingChunkBuffer(ChunkGrid& grid,
                           const config::PipelineConfig& cfg,
                           const cache::MemoryPressureSource* pressure,
                           obs::Observer* observer);

        CachingChunkBuffer(const CachingChunkBuffer&)            = delete;
        CachingChunkBuffer& operator=(const CachingChunkBuffer&) = delete;

        /// Cache first; on miss consult the grid and remember a non-null result.
        BlockHandle get_blocks(const ChunkCoord& coord);

        /// Drop chunks from the grid, the cache and the pool.
        void remove_all();

        /// Grid chunks plus cached chunks.
        std::size_t chunk_count() const;

        /// "Buffer Memory - Usage: x%, <cache stats>, <pool stats>".
        std::string memory_report() const;

        /// Log statistics at info level.
        void log_stats() const;

        /**
         * @brief Periodic upkeep: log, then flush everything if utilization is
         *        above the maintenance ratio, otherwise let the cache trim itself.
         * @return true if a full flush happened.
         */
        bool perform_maintenance();

        ChunkCache&          cache() noexcept { return cache_; }
        mem::ChunkBlockPool& pool() noexcept { return pool_; }

    private:
        ChunkGrid&                         grid_;
        const cache::MemoryPressureSource* pressure_;
        obs::Observer*                     observer_;
        double                             maintenance_ratio_;
        ChunkCache                         cache_;
        mem::ChunkBlockPool                pool_;
    };

} // namespace vox::world
