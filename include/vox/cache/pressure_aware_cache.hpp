#pragma once
// vox: PressureAwareCache
// Bounded key -> handle cache with LRU recency and two-tier, pressure-driven eviction.
//   • Recency: intrusive-style list (most recent at back) + hash index of list iterators.
//   • Hard bound: after every insert, size > capacity evicts exactly one LRU entry.
//   • Pressure: before an insert, utilization > high shrinks to the low-water-mark,
//     utilization > critical shrinks to a quarter of the current size.
// Concurrency: one mutex guards map + list, held only for O(1) lookup/splice or the
// eviction scan. Sampling, logging, value destruction and the reclaim hint run outside it.

#include <algorithm>
#include <atomic>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "vox/cache/memory_pressure.hpp"
#include "vox/config/constants.hpp"
#include "vox/obs/observability.hpp"
#include "vox/os/memory.hpp"

namespace vox::cache {

/// @brief Value types the cache accepts: nullable handles (null = absent).
template <class V>
concept NullableHandle = std::copyable<V> && requires(const V& v) {
  { v == nullptr } -> std::convertible_to<bool>;
};

/// @brief Construction parameters of a PressureAwareCache.
struct CacheOptions {
  std::size_t                 capacity = config::constants::CACHE_DEFAULT_CAPACITY; ///< Hard entry bound (>= 1)
  PressureThresholds          thresholds{};
  const MemoryPressureSource* pressure = nullptr;   ///< Not owned; null disables pressure cleanup
  obs::Observer*              observer = nullptr;   ///< Not owned; null disables logging
  bool                        reclaim_after_critical = true;
  std::string_view            name = "cache";        ///< Component label in log lines
};

/// @brief Snapshot of cache state and counters.
struct CacheStats {
  std::size_t           size{0};
  std::size_t           capacity{0};
  std::uint64_t         hits{0};
  std::uint64_t         misses{0};
  std::uint64_t         evictions{0};
  std::uint64_t         cleanups{0};
  std::optional<double> utilization{};  ///< Sampled when the snapshot was taken

  /// @brief hits / (hits + misses), 0 before the first lookup.
  double hit_ratio() const noexcept {
    const auto total = hits + misses;
    return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
  }
};

/// @brief "Cache Stats - Size: s/c, Hits: ..." one-liner.
std::string describe(const CacheStats& s);

template <class K, NullableHandle V, class Hash = std::hash<K>, class KeyEq = std::equal_to<K>>
class PressureAwareCache final {
public:
  using Clock = std::chrono::steady_clock;

  explicit PressureAwareCache(CacheOptions opts)
    : opts_(opts),
      capacity_(std::max<std::size_t>(1, opts.capacity)),
      low_water_mark_(std::max<std::size_t>(1, capacity_ / config::constants::LOW_WATER_DIVISOR))
  {
    opts_.capacity = capacity_;
  }

  PressureAwareCache(const PressureAwareCache&)            = delete;
  PressureAwareCache& operator=(const PressureAwareCache&) = delete;

  /// @brief Look up @p key; a hit becomes the most recently used entry.
  std::optional<V> get(const K& key) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = index_.find(key);
      if (it != index_.end()) {
        touch(it->second);
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second->value;
      }
    }
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }

  /// @brief Insert or replace; a null @p value is ignored.
  void put(const K& key, V value) {
    if (value == nullptr) {
      return;
    }

    std::optional<double> u = sample();
    const PressureTier tier = u ? classify(*u, opts_.thresholds) : PressureTier::Normal;

    std::vector<V> dropped;   // destroyed after the lock is released
    Pass pass;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (tier != PressureTier::Normal) {
        // A replaced key is moved to the recent end first and needs no free slot.
        auto present = index_.find(key);
        if (present != index_.end()) {
          touch(present->second);
        }
        pass = cleanup_locked(tier, present != index_.end() ? 0 : 1, dropped);
      }

      auto it = index_.find(key);
      if (it != index_.end()) {
        dropped.push_back(std::move(it->second->value));
        it->second->value = std::move(value);
        touch(it->second);
      } else {
        lru_.push_back(Entry{key, std::move(value), Clock::now()});
        index_.emplace(key, std::prev(lru_.end()));
      }

      if (index_.size() > capacity_) {
        evict_oldest_locked(dropped);
      }
    }

    if (tier != PressureTier::Normal) {
      finish_pass(tier, *u, pass);
    }
  }

  /// @brief Drop @p key if present.
  void remove(const K& key) {
    std::optional<V> dropped;
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      return;
    }
    dropped = std::move(it->second->value);
    lru_.erase(it->second);
    index_.erase(it);
  }

  /// @brief Drop every entry and the recency bookkeeping.
  void clear() {
    std::list<Entry> drained;
    {
      std::lock_guard<std::mutex> lk(mu_);
      drained.swap(lru_);
      index_.clear();
    }
    if (opts_.observer) {
      opts_.observer->log(obs::Level::Debug, "cache cleared manually");
    }
  }

  /**
   * @brief Run a standalone cleanup pass if the pressure source reports high usage.
   * @return Number of evicted entries (0 if pressure is normal or unknown).
   */
  std::size_t trim() {
    std::optional<double> u = sample();
    if (!u) return 0;
    const PressureTier tier = classify(*u, opts_.thresholds);
    if (tier == PressureTier::Normal) return 0;

    std::vector<V> dropped;
    Pass pass;
    {
      std::lock_guard<std::mutex> lk(mu_);
      pass = cleanup_locked(tier, 0, dropped);
    }
    finish_pass(tier, *u, pass);
    return pass.before - pass.after;
  }

  /// @brief Membership test that leaves recency and counters untouched.
  bool contains(const K& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    return index_.find(key) != index_.end();
  }

  /// @brief Time of the last insert or hit for @p key.
  std::optional<Clock::time_point> last_access(const K& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second->last_access;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return index_.size();
  }

  std::size_t capacity() const noexcept { return capacity_; }
  std::size_t low_water_mark() const noexcept { return low_water_mark_; }

  /// @brief Snapshot of counters plus a fresh utilization sample.
  CacheStats stats() const {
    CacheStats s;
    s.size        = size();
    s.capacity    = capacity_;
    s.hits        = hits_.load(std::memory_order_relaxed);
    s.misses      = misses_.load(std::memory_order_relaxed);
    s.evictions   = evictions_.load(std::memory_order_relaxed);
    s.cleanups    = cleanups_.load(std::memory_order_relaxed);
    s.utilization = sample();
    return s;
  }

private:
  struct Entry {
    K                 key;
    V                 value;
    Clock::time_point last_access;
  };
  using List  = std::list<Entry>;
  using Index = std::unordered_map<K, typename List::iterator, Hash, KeyEq>;

  struct Pass {
    std::size_t before{0};
    std::size_t after{0};
  };

  std::optional<double> sample() const noexcept {
    return opts_.pressure ? opts_.pressure->utilization() : std::nullopt;
  }

  /// Move @p it to the most-recent end and refresh its timestamp.
  void touch(typename List::iterator it) {
    lru_.splice(lru_.end(), lru_, it);
    it->last_access = Clock::now();
  }

  void evict_oldest_locked(std::vector<V>& dropped) {
    if (lru_.empty()) return;
    auto oldest = lru_.begin();
    dropped.push_back(std::move(oldest->value));
    index_.erase(oldest->key);
    lru_.erase(oldest);
    evictions_.fetch_add(1, std::memory_order_relaxed);
  }

  /**
   * Evict LRU entries down to the tier target. @p reserve slots are kept free
   * for an insert that follows in the same critical section, so the size
   * right after that insert still meets the target.
   */
  Pass cleanup_locked(PressureTier tier, std::size_t reserve, std::vector<V>& dropped) {
    Pass pass;
    pass.before = index_.size();

    std::size_t target = low_water_mark_;
    if (tier == PressureTier::Critical) {
      target = std::max<std::size_t>(1, pass.before / config::constants::CRITICAL_SHRINK_DIVISOR);
    }
    target = target > reserve ? target - reserve : 0;

    while (index_.size() > target && !lru_.empty()) {
      evict_oldest_locked(dropped);
    }
    cleanups_.fetch_add(1, std::memory_order_relaxed);
    pass.after = index_.size();
    return pass;
  }

  void finish_pass(PressureTier tier, double utilization, const Pass& pass) {
    if (tier == PressureTier::Critical && opts_.reclaim_after_critical) {
      (void)os::request_memory_reclaim(); // advisory only
    }
    if (opts_.observer) {
      obs::CleanupEvent ev;
      ev.component   = opts_.name;
      ev.tier        = tier;
      ev.utilization = utilization;
      ev.size_before = pass.before;
      ev.size_after  = pass.after;
      ev.evicted     = pass.before - pass.after;
      opts_.observer->record(ev);
    }
  }

  CacheOptions      opts_;
  const std::size_t capacity_;
  const std::size_t low_water_mark_;

  mutable std::mutex mu_;
  List               lru_;     ///< Least recent at front
  Index              index_;

  std::atomic<std::uint64_t> hits_{0}, misses_{0}, evictions_{0}, cleanups_{0};
};

} // namespace vox::cache
