// =============================================================
// File: include/vox/mem/recyclable_pool.hpp
// =============================================================
#pragma once

#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <new>
#include <utility>

#include "vox/mem/bounded_queue.hpp"

namespace vox::mem {

/// @brief A type that can be restored to a blank, reusable state.
template <class T>
concept Recyclable = requires(T& t) {
  { t.reset() } -> std::same_as<void>;
};

/// @brief Snapshot of pool counters. in_use = borrowed - returned.
struct PoolStats {
  std::size_t   stored{0};    ///< Instances waiting for reuse
  std::size_t   max_size{0};  ///< Upper bound on stored
  std::uint64_t borrowed{0};
  std::uint64_t returned{0};
  std::uint64_t created{0};   ///< Instances built by the factory
  std::int64_t  in_use{0};
};

/**
 * @brief Bounded pool of reusable heap instances backed by a lock-free MPMC store.
 *
 * Design:
 *  - At most @c max_size idle instances are kept; extra returns are dropped.
 *  - borrow() never fails: an empty store falls through to the factory.
 *  - Every instance handed out by borrow() has been reset().
 *  - All operations are safe under concurrent callers without external locking.
 *
 * Ownership: borrowed instances are owned by the caller (std::unique_ptr) until
 * they are handed back with return_object().
 */
template <Recyclable T>
class RecyclablePool {
public:
  using Ptr     = std::unique_ptr<T>;
  using Factory = std::function<Ptr()>;

  /// @brief Construct a pool that keeps at most @p max_size idle instances.
  /// @throws std::bad_alloc if the store cannot be allocated.
  RecyclablePool(Factory factory, std::size_t max_size)
    : factory_(std::move(factory)),
      max_size_(max_size)
  {
    auto storeExp = BoundedQueue<Ptr>::with_capacity(round_up_pow2(max_size));
    if (!storeExp) {
      throw std::bad_alloc();
    }
    store_ = std::move(*storeExp);
  }

  RecyclablePool(const RecyclablePool&)            = delete;
  RecyclablePool& operator=(const RecyclablePool&) = delete;

  /// @brief Take an idle instance (reset) or build a fresh one.
  Ptr borrow() {
    Ptr obj;
    if (store_.pop(obj)) {
      stored_.fetch_sub(1, std::memory_order_acq_rel);
      obj->reset();
      borrowed_.fetch_add(1, std::memory_order_relaxed);
      return obj;
    }

    // Counted only once the factory has produced an instance.
    Ptr fresh = factory_();
    created_.fetch_add(1, std::memory_order_relaxed);
    borrowed_.fetch_add(1, std::memory_order_relaxed);
    return fresh;
  }

  /// @brief Hand an instance back. Dropped silently when the store is full.
  void return_object(Ptr obj) noexcept {
    if (!obj) {
      return;
    }
    returned_.fetch_add(1, std::memory_order_relaxed);

    if (!reserve_slot()) {
      return; // store full, obj is destroyed here
    }
    obj->reset();
    if (!store_.push(std::move(obj))) {
      // Slot reservation bounds the queue below its capacity, so this only
      // happens if the invariant is broken; give the slot back and drop obj.
      stored_.fetch_sub(1, std::memory_order_acq_rel);
    }
  }

  /// @brief Drop every idle instance. Borrowed instances are unaffected.
  void clear() noexcept {
    Ptr obj;
    while (store_.pop(obj)) {
      stored_.fetch_sub(1, std::memory_order_acq_rel);
      obj.reset();
    }
  }

  /// @brief Number of idle instances.
  std::size_t size() const noexcept { return stored_.load(std::memory_order_acquire); }

  std::size_t max_size() const noexcept { return max_size_; }

  /// @brief Snapshot of the pool counters.
  PoolStats stats() const noexcept {
    PoolStats s;
    s.stored   = size();
    s.max_size = max_size_;
    s.borrowed = borrowed_.load(std::memory_order_relaxed);
    s.returned = returned_.load(std::memory_order_relaxed);
    s.created  = created_.load(std::memory_order_relaxed);
    s.in_use   = static_cast<std::int64_t>(s.borrowed) - static_cast<std::int64_t>(s.returned);
    return s;
  }

private:
  /// @brief Claim one of the max_size_ store slots; false when all are taken.
  bool reserve_slot() noexcept {
    std::size_t cur = stored_.load(std::memory_order_acquire);
    while (cur < max_size_) {
      if (stored_.compare_exchange_weak(cur, cur + 1, std::memory_order_acq_rel)) {
        return true;
      }
    }
    return false;
  }

  Factory                     factory_;
  std::size_t                 max_size_{0};
  BoundedQueue<Ptr>           store_{};             ///< Idle instances
  std::atomic<std::size_t>    stored_{0};           ///< Reserved store slots (>= queued items)
  std::atomic<std::uint64_t>  borrowed_{0};
  std::atomic<std::uint64_t>  returned_{0};
  std::atomic<std::uint64_t>  created_{0};
};

} // namespace vox::mem
