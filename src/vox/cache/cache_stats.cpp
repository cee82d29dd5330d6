#include "vox/cache/pressure_aware_cache.hpp"

#include <cstdio>

namespace vox::cache {

std::string describe(const CacheStats& s) {
    char usage[24] = "n/a";
    if (s.utilization) {
        std::snprintf(usage, sizeof(usage), "%.1f%%", *s.utilization * 100.0);
    }
    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  "Cache Stats - Size: %zu/%zu, Hits: %llu, Misses: %llu, Hit Ratio: %.2f%%, "
                  "Evictions: %llu, Memory Cleanups: %llu, Memory Usage: %s",
                  s.size, s.capacity,
                  static_cast<unsigned long long>(s.hits),
                  static_cast<unsigned long long>(s.misses),
                  s.hit_ratio() * 100.0,
                  static_cast<unsigned long long>(s.evictions),
                  static_cast<unsigned long long>(s.cleanups),
                  usage);
    return std::string(buf);
}

} // namespace vox::cache
