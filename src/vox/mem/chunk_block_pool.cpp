// =============================================================
// File: src/vox/mem/chunk_block_pool.cpp
// =============================================================
#include "vox/mem/chunk_block_pool.hpp"

#include <cstdio>
#include <string>

namespace vox::mem {

ChunkBlockPool::ChunkBlockPool(std::size_t max_size)
  : pool_([] { return std::make_unique<PooledChunkBlocks>(); }, max_size)
{
}

ChunkBlockPool::Ptr ChunkBlockPool::borrow() {
  return pool_.borrow();
}

void ChunkBlockPool::return_object(Ptr pooled) noexcept {
  pool_.return_object(std::move(pooled));
}

ChunkBlockPool::Ptr ChunkBlockPool::create_pooled(world::BlockHandle blocks) {
  Ptr pooled = borrow();
  pooled->set_blocks(std::move(blocks));
  return pooled;
}

void ChunkBlockPool::clear() noexcept {
  pool_.clear();
}

std::size_t ChunkBlockPool::size() const noexcept {
  return pool_.size();
}

PoolStats ChunkBlockPool::stats() const noexcept {
  return pool_.stats();
}

void ChunkBlockPool::log_stats(obs::Observer& observer) const {
  observer.log(obs::Level::Debug, "Chunk Data " + describe(stats()));
}

std::string describe(const PoolStats& s) {
  char buf[192];
  std::snprintf(buf, sizeof(buf),
                "Pool Stats - Size: %zu/%zu, Borrowed: %llu, Returned: %llu, Created: %llu, In Use: %lld",
                s.stored, s.max_size,
                static_cast<unsigned long long>(s.borrowed),
                static_cast<unsigned long long>(s.returned),
                static_cast<unsigned long long>(s.created),
                static_cast<long long>(s.in_use));
  return std::string(buf);
}

} // namespace vox::mem
