/**
 * @file memory_pressure.cpp
 * @brief /proc-backed pressure sources.
 */
#include "vox/cache/memory_pressure.hpp"
#include "vox/os/memory.hpp"

namespace vox::cache {

const char* to_string(PressureTier tier) noexcept {
    switch (tier) {
        case PressureTier::Normal:   return "normal";
        case PressureTier::High:     return "high";
        case PressureTier::Critical: return "critical";
    }
    return "unknown";
}

std::optional<double> SystemMemoryPressure::utilization() const noexcept {
    const auto mem = os::query_system_memory();
    if (!mem) return std::nullopt;
    const auto used = mem->total > mem->available ? mem->total - mem->available : 0;
    return static_cast<double>(used) / static_cast<double>(mem->total);
}

std::optional<double> ProcessMemoryPressure::utilization() const noexcept {
    if (budget_bytes_ == 0) return std::nullopt;
    const auto rss = os::query_process_resident();
    if (!rss) return std::nullopt;
    const double ratio = static_cast<double>(*rss) / static_cast<double>(budget_bytes_);
    return ratio > 1.0 ? 1.0 : ratio;
}

} // namespace vox::cache
