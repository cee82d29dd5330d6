#pragma once
/**
 * @file memory_pressure.hpp
 * @brief Injectable memory-utilization samplers and pressure tiers.
 *
 * A source reports used / available as a ratio in [0, 1]. Sampling must be
 * cheap and free of side effects; callers sample on every insert.
 * std::nullopt means "unknown": pressure-driven eviction is then skipped.
 */

#include <atomic>
#include <cstdint>
#include <optional>

#include "vox/config/constants.hpp"

namespace vox::cache {

    /// @brief Pressure bands used to pick an eviction target.
    enum class PressureTier : std::uint8_t {
        Normal = 0,  ///< No cleanup
        High,        ///< Shrink to low-water-mark
        Critical     ///< Shrink to a quarter of current size
    };

    /// @brief Thresholds separating the tiers (strictly greater-than).
    struct PressureThresholds {
        double high     = config::constants::PRESSURE_HIGH_RATIO;
        double critical = config::constants::PRESSURE_CRITICAL_RATIO;
    };

    /// @brief Map a utilization ratio onto a tier.
    constexpr PressureTier classify(double utilization, const PressureThresholds& t) noexcept {
        if (utilization > t.critical) return PressureTier::Critical;
        if (utilization > t.high)     return PressureTier::High;
        return PressureTier::Normal;
    }

    const char* to_string(PressureTier tier) noexcept;

    /** @class MemoryPressureSource
     *  @brief Read-only utilization sampler.
     */
    class MemoryPressureSource {
    public:
        virtual ~MemoryPressureSource() = default;
        /// Current utilization in [0, 1], or nullopt if unavailable.
        virtual std::optional<double> utilization() const noexcept = 0;
    };

    /**
     * @brief Source returning a value set by the owner.
     *
     * Used for deterministic tests and for hosts that compute pressure
     * themselves (e.g. a GPU budget). A negative value means unavailable.
     */
    class FixedPressureSource final : public MemoryPressureSource {
    public:
        explicit FixedPressureSource(double ratio = 0.0) noexcept : ratio_(ratio) {}

        void set(double ratio) noexcept { ratio_.store(ratio, std::memory_order_relaxed); }
        void set_unavailable() noexcept { ratio_.store(-1.0, std::memory_order_relaxed); }

        std::optional<double> utilization() const noexcept override {
            const double r = ratio_.load(std::memory_order_relaxed);
            if (r < 0.0) return std::nullopt;
            return r;
        }

    private:
        std::atomic<double> ratio_;
    };

    /// @brief Whole-machine utilization: 1 - MemAvailable / MemTotal.
    class SystemMemoryPressure final : public MemoryPressureSource {
    public:
        std::optional<double> utilization() const noexcept override;
    };

    /// @brief Resident set size of this process relative to a byte budget.
    class ProcessMemoryPressure final : public MemoryPressureSource {
    public:
        explicit ProcessMemoryPressure(std::uint64_t budget_bytes) noexcept
            : budget_bytes_(budget_bytes) {}

        std::optional<double> utilization() const noexcept override;

        std::uint64_t budget_bytes() const noexcept { return budget_bytes_; }

    private:
        std::uint64_t budget_bytes_;
    };

} // namespace vox::cache
