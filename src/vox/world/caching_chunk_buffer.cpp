#include "vox/world/caching_chunk_buffer.hpp"

#include <cstdio>

namespace vox::world {

namespace {

cache::CacheOptions cache_options(const config::PipelineConfig& cfg,
                                  const cache::MemoryPressureSource* pressure,
                                  obs::Observer* observer) {
    cache::CacheOptions o;
    o.capacity               = cfg.cache.capacity;
    o.thresholds             = cfg.cache.thresholds;
    o.pressure               = pressure;
    o.observer               = observer;
    o.reclaim_after_critical = cfg.cache.reclaim_hint;
    o.name                   = "chunk-cache";
    return o;
}

} // namespace

CachingChunkBuffer::CachingChunkBuffer(ChunkGrid& grid,
                                       const config::PipelineConfig& cfg,
                                       const cache::MemoryPressureSource* pressure,
                                       obs::Observer* observer)
    : grid_(grid),
      pressure_(pressure),
      observer_(observer),
      maintenance_ratio_(cfg.buffer.maintenance_ratio),
      cache_(cache_options(cfg, pressure, observer)),
      pool_(cfg.pool.max_size)
{
    if (observer_) {
        char line[128];
        std::snprintf(line, sizeof(line), "chunk buffer ready - cache size: %zu, pool size: %zu",
                      cache_.capacity(), cfg.pool.max_size);
        observer_->log(obs::Level::Info, line);
    }
}

BlockHandle CachingChunkBuffer::get_blocks(const ChunkCoord& coord) {
    if (auto cached = cache_.get(coord)) {
        return *cached;
    }
    BlockHandle blocks = grid_.get(coord);
    if (blocks) {
        cache_.put(coord, blocks);
    }
    return blocks;
}

void CachingChunkBuffer::remove_all() {
    grid_.clear();
    cache_.clear();
    pool_.clear();
    if (observer_) {
        observer_->log(obs::Level::Debug, "all chunks removed from buffer");
    }
}

std::size_t CachingChunkBuffer::chunk_count() const {
    return grid_.size() + cache_.size();
}

std::string CachingChunkBuffer::memory_report() const {
    const auto u = pressure_ ? pressure_->utilization() : std::nullopt;
    char usage[24] = "n/a";
    if (u) {
        std::snprintf(usage, sizeof(usage), "%.1f%%", *u * 100.0);
    }
    return std::string("Buffer Memory - Usage: ") + usage + ", " +
           cache::describe(cache_.stats()) + ", " + mem::describe(pool_.stats());
}

void CachingChunkBuffer::log_stats() const {
    if (!observer_) return;
    observer_->log(obs::Level::Info, memory_report());
    pool_.log_stats(*observer_);
}

bool CachingChunkBuffer::perform_maintenance() {
    log_stats();

    const auto u = pressure_ ? pressure_->utilization() : std::nullopt;
    if (u && *u > maintenance_ratio_) {
        if (observer_) {
            observer_->log(obs::Level::Info, "high memory usage during maintenance, clearing caches");
        }
        remove_all();
        return true;
    }
    (void)cache_.trim();
    return false;
}

} // namespace vox::world
