#pragma once

#include <cstddef>

#include "vox/world/chunk.hpp"

namespace vox::world {

    /** @class ChunkGrid
     *  @brief Boundary of the external chunk index that spans the export bounds.
     *
     *  Implementations synchronize with the rest of the pipeline themselves;
     *  every method may be called from several threads.
     */
    class ChunkGrid {
    public:
        virtual ~ChunkGrid() = default;

        /// Decoded blocks at @p coord, or null if the chunk is not loaded/present.
        virtual BlockHandle get(const ChunkCoord& coord) = 0;
        virtual void put(const ChunkCoord& coord, BlockHandle blocks) = 0;
        virtual void remove(const ChunkCoord& coord) = 0;
        virtual void clear() = 0;
        virtual std::size_t size() const = 0;
    };

} // namespace vox::world
