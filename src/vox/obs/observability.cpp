/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Observer.
 */
#include "vox/obs/observability.hpp"
#include <atomic>
#include <mutex>
#include <cstdio>

namespace vox::obs {

    const char* to_string(Level level) noexcept {
        switch (level) {
            case Level::Debug: return "debug";
            case Level::Info:  return "info";
            case Level::Warn:  return "warn";
            case Level::Error: return "error";
        }
        return "unknown";
    }

    class SimpleObserver : public Observer {
    public:
        void record(const CleanupEvent& e) override {
            const Level lvl = e.tier == cache::PressureTier::Critical ? Level::Info : Level::Debug;
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.cleanups++;
            if (e.tier == cache::PressureTier::Critical) ctr_.critical_cleanups++;
            ctr_.evicted += e.evicted;
            if (!enabled(lvl)) return;
            // JSON-ish line (one event per line)
            std::printf(
              R"({"level":"%s","event":"cleanup","component":"%.*s","tier":"%s","utilization":%.3f,"before":%zu,"after":%zu,"evicted":%zu})" "\n",
              to_string(lvl), static_cast<int>(e.component.size()), e.component.data(),
              cache::to_string(e.tier), e.utilization, e.size_before, e.size_after, e.evicted);
            std::fflush(stdout);
        }
        void record(const DecodeFailureEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.decode_failures++;
            if (!enabled(Level::Error)) return;
            std::printf(
              R"({"level":"error","event":"decode_failure","error":"%.*s","offset":%llu,"detail":"%s"})" "\n",
              static_cast<int>(e.error.size()), e.error.data(),
              static_cast<unsigned long long>(e.offset), e.detail.c_str());
            std::fflush(stdout);
        }
        void log(Level level, std::string_view message) override {
            std::lock_guard<std::mutex> lk(mu_);
            if (!enabled(level)) return;
            ctr_.log_lines++;
            std::printf(R"({"level":"%s","msg":"%.*s"})" "\n",
                        to_string(level), static_cast<int>(message.size()), message.data());
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
        void set_min_level(Level l) { min_level_.store(l, std::memory_order_relaxed); }
    private:
        bool enabled(Level l) const {
            return static_cast<int>(l) >= static_cast<int>(min_level_.load(std::memory_order_relaxed));
        }
        mutable std::mutex mu_;
        Counters ctr_;
        std::atomic<Level> min_level_{Level::Info};
    };

    namespace {
        SimpleObserver& simple_observer() {
            static SimpleObserver obs; // process-wide singleton
            return obs;
        }
    } // namespace

    Observer* make_simple_observer() {
        return &simple_observer();
    }

    void set_min_level(Level min_level) {
        simple_observer().set_min_level(min_level);
    }

} // namespace vox::obs
