#if defined(__linux__)

#include "vox/os/memory.hpp"

#include <atomic>
#include <cstdio>
#include <cstring>
#include <exception>
#include <thread>

#include <unistd.h>
#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace vox::os {

namespace {

/// Parse "<Key>:   <value> kB" lines of /proc/meminfo.
bool parse_kb_line(const char* line, const char* key, std::uint64_t& out_bytes) {
    const std::size_t n = std::strlen(key);
    if (std::strncmp(line, key, n) != 0) return false;
    unsigned long long kb = 0;
    if (std::sscanf(line + n, "%llu", &kb) != 1) return false;
    out_bytes = static_cast<std::uint64_t>(kb) * 1024u;
    return true;
}

std::atomic<bool> g_reclaim_in_flight{false};

} // namespace

std::optional<SystemMemory> query_system_memory() noexcept {
    std::FILE* f = std::fopen("/proc/meminfo", "r");
    if (!f) return std::nullopt;

    SystemMemory mem;
    bool have_total = false, have_available = false;
    char line[128];
    while (std::fgets(line, sizeof(line), f)) {
        if (parse_kb_line(line, "MemTotal:", mem.total))         have_total = true;
        else if (parse_kb_line(line, "MemAvailable:", mem.available)) have_available = true;
        if (have_total && have_available) break;
    }
    std::fclose(f);

    if (!have_total || !have_available || mem.total == 0) return std::nullopt;
    return mem;
}

std::optional<std::uint64_t> query_process_resident() noexcept {
    std::FILE* f = std::fopen("/proc/self/statm", "r");
    if (!f) return std::nullopt;

    unsigned long size = 0, resident = 0;
    const int n = std::fscanf(f, "%lu %lu", &size, &resident);
    std::fclose(f);
    if (n != 2) return std::nullopt;

    const long page = ::sysconf(_SC_PAGESIZE);
    if (page <= 0) return std::nullopt;
    return static_cast<std::uint64_t>(resident) * static_cast<std::uint64_t>(page);
}

bool request_memory_reclaim() noexcept {
#if defined(__GLIBC__)
    bool expected = false;
    if (!g_reclaim_in_flight.compare_exchange_strong(expected, true)) {
        return false; // previous hint still running
    }
    try {
        std::thread([] {
            ::malloc_trim(0);
            g_reclaim_in_flight.store(false, std::memory_order_release);
        }).detach();
    } catch (const std::exception&) {
        g_reclaim_in_flight.store(false, std::memory_order_release);
        return false;
    }
    return true;
#else
    return false;
#endif
}

} // namespace vox::os
#endif
