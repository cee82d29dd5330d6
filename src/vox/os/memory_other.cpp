#if !defined(__linux__)

#include "vox/os/memory.hpp"

namespace vox::os {

std::optional<SystemMemory> query_system_memory() noexcept {
    return std::nullopt; // TODO: sysctl(HW_MEMSIZE) + host_statistics64 on macOS
}

std::optional<std::uint64_t> query_process_resident() noexcept {
    return std::nullopt;
}

bool request_memory_reclaim() noexcept {
    return false;
}

} // namespace vox::os
#endif
