#pragma once
/**
 * @file memory.hpp
 * @brief Platform memory probes and the advisory reclaim hint.
 * @note Linux reads /proc; other platforms report "unavailable".
 */

#include <cstdint>
#include <optional>

namespace vox::os {

    /// @brief Physical memory figures of the machine, in bytes.
    struct SystemMemory {
        std::uint64_t total{0};
        std::uint64_t available{0};
    };

    /// @brief Total/available physical memory, or nullopt if it cannot be read.
    std::optional<SystemMemory> query_system_memory() noexcept;

    /// @brief Resident set size of the current process, or nullopt.
    std::optional<std::uint64_t> query_process_resident() noexcept;

    /// @brief Ask the allocator to return free pages to the OS.
    /// Fire-and-forget: runs on a detached thread, at most one at a time.
    /// @return true if a request was started; false if one is already running
    ///         or the platform has no such facility.
    bool request_memory_reclaim() noexcept;

} // namespace vox::os
