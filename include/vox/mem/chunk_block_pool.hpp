// =============================================================
// File: include/vox/mem/chunk_block_pool.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "vox/mem/recyclable_pool.hpp"
#include "vox/obs/observability.hpp"
#include "vox/world/chunk.hpp"

namespace vox::mem {

/**
 * @brief Reusable slot holding an optional decoded chunk handle.
 *
 * reset() drops the reference so the pooled slot never pins decoded data;
 * the slot itself stays allocated for the next borrower.
 */
class PooledChunkBlocks final {
public:
  PooledChunkBlocks() = default;

  void set_blocks(world::BlockHandle blocks) noexcept { blocks_ = std::move(blocks); }
  const world::BlockHandle& blocks() const noexcept { return blocks_; }

  /// @brief True if this wrapper currently holds block data.
  bool has_blocks() const noexcept { return blocks_ != nullptr; }

  void reset() noexcept { blocks_.reset(); }

private:
  world::BlockHandle blocks_{};
};

/**
 * @brief RecyclablePool bound to PooledChunkBlocks wrappers.
 *
 * Decode workers borrow a wrapper per chunk, attach the decoded handle, pass
 * it down the geometry pipeline and return it when done.
 */
class ChunkBlockPool {
public:
  using Ptr = RecyclablePool<PooledChunkBlocks>::Ptr;

  /// @brief Construct a pool keeping at most @p max_size idle wrappers.
  explicit ChunkBlockPool(std::size_t max_size);

  ChunkBlockPool(const ChunkBlockPool&)            = delete;
  ChunkBlockPool& operator=(const ChunkBlockPool&) = delete;

  /// @brief Borrow a blank wrapper.
  Ptr borrow();

  /// @brief Return a wrapper; null is ignored, overflow is dropped.
  void return_object(Ptr pooled) noexcept;

  /// @brief Borrow a wrapper and attach @p blocks in one call.
  Ptr create_pooled(world::BlockHandle blocks);

  void clear() noexcept;
  std::size_t size() const noexcept;
  PoolStats stats() const noexcept;

  /// @brief Emit the pool statistics line at debug level.
  void log_stats(obs::Observer& observer) const;

private:
  RecyclablePool<PooledChunkBlocks> pool_;
};

/// @brief "Pool Stats - Size: s/m, Borrowed: ..." one-liner.
std::string describe(const PoolStats& s);

} // namespace vox::mem
