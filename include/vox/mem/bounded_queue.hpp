/**
 * @file bounded_queue.hpp
 * @brief Bounded multi-producer/multi-consumer ring buffer (owning, lock-free).
 *
 * Design goals:
 *  - Exception-free hot path (push/pop return bool).
 *  - One-time allocation during setup via factory; no allocations after.
 *  - Per-cell sequence numbers (Vyukov scheme): any number of producers and
 *    consumers, no locks, every slot usable.
 *  - Indices padded to avoid false sharing.
 *
 * Construction:
 *  - Use BoundedQueue<T>::with_capacity(capacity_pow2) to build.
 *
 * @tparam T Element type. Must be default-constructible and nothrow-move-assignable.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include "vox/compat/expected.hpp"  // vox_detail::expected / unexpected

namespace vox::mem {

/// Cache line size hint (adjust per platform if needed).
inline constexpr std::size_t kCacheLine = 64;

/**
 * @brief Error codes reported by the factory (setup time only).
 * These errors are never produced by push/pop.
 */
enum class QueueError : std::uint8_t {
  CapacityTooSmall = 1,      ///< Capacity must be at least 2
  CapacityNotPowerOfTwo,     ///< Capacity must be power-of-two
  AllocationFailed,          ///< Cell allocation failed
  ElementNotNothrowMovable   ///< T must be nothrow-movable
};

/// @brief Trait to constrain element types.
template <class T>
struct QueueTraits {
  static constexpr bool ok =
    std::is_default_constructible_v<T> &&
    (std::is_trivially_copyable_v<T> || std::is_nothrow_move_assignable_v<T>);
};

/// @brief Smallest power of two >= @p n (and >= 2).
constexpr std::size_t round_up_pow2(std::size_t n) noexcept {
  std::size_t p = 2;
  while (p < n) p <<= 1;
  return p;
}

/**
 * @brief Bounded MPMC ring buffer (owning).
 *
 * @tparam T Element type.
 */
template <class T>
class BoundedQueue final {
  static_assert(std::atomic<std::size_t>::is_always_lock_free,
                "std::atomic<size_t> must be lock-free on this target");

  struct Cell {
    std::atomic<std::size_t> seq{0};
    T                        value{};
  };

public:
  using value_type = T;

  /// @brief Default-constructed empty shell (use with factory).
  BoundedQueue() noexcept = default;

  /**
   * @brief Factory: validates input and allocates once (no exceptions).
   * @param capacity_pow2 Ring capacity (power-of-two, >= 2).
   * @return expected<BoundedQueue, QueueError> constructed queue or error.
   */
  static vox_detail::expected<BoundedQueue, QueueError>
  with_capacity(std::size_t capacity_pow2) noexcept {
    if (capacity_pow2 < 2) {
      return vox_detail::unexpected<QueueError>(QueueError::CapacityTooSmall);
    }
    if ((capacity_pow2 & (capacity_pow2 - 1)) != 0) {
      return vox_detail::unexpected<QueueError>(QueueError::CapacityNotPowerOfTwo);
    }
    if (!QueueTraits<T>::ok) {
      return vox_detail::unexpected<QueueError>(QueueError::ElementNotNothrowMovable);
    }

    std::unique_ptr<Cell[]> cells(new (std::nothrow) Cell[capacity_pow2]);
    if (!cells) {
      return vox_detail::unexpected<QueueError>(QueueError::AllocationFailed);
    }
    for (std::size_t i = 0; i < capacity_pow2; ++i) {
      cells[i].seq.store(i, std::memory_order_relaxed);
    }

    BoundedQueue q;
    q.capacity_ = capacity_pow2;
    q.mask_     = capacity_pow2 - 1;
    q.cells_    = std::move(cells);
    return q;
  }

  BoundedQueue(const BoundedQueue&)            = delete; ///< Non-copyable
  BoundedQueue& operator=(const BoundedQueue&) = delete; ///< Non-assignable

  /// @brief Move constructor (never move a queue that is in use).
  BoundedQueue(BoundedQueue&& other) noexcept { move_from(std::move(other)); }

  /// @brief Move assignment (never move a queue that is in use).
  BoundedQueue& operator=(BoundedQueue&& other) noexcept {
    if (this != &other) move_from(std::move(other));
    return *this;
  }

  /**
   * @brief Push by rvalue reference.
   * @param v Element to move in.
   * @return false if queue is full (v is left untouched).
   */
  bool push(T&& v) noexcept {
    std::size_t pos = 0;
    Cell* cell = claim_enqueue(pos);
    if (cell == nullptr) {
      return false; // full
    }
    cell->value = std::move(v);
    cell->seq.store(pos + 1, std::memory_order_release);
    return true;
  }

  /**
   * @brief Push by const reference (copyable T only).
   * @return false if queue is full.
   */
  bool push(const T& v) noexcept(std::is_nothrow_copy_assignable_v<T>)
    requires std::is_copy_assignable_v<T>
  {
    T copy = v;
    return push(std::move(copy));
  }

  /**
   * @brief Pop one element into output.
   * @param out Destination reference to receive the element.
   * @return false if queue is empty.
   */
  bool pop(T& out) noexcept {
    if (!cells_) return false;
    std::size_t pos = dequeue_pos_.load(std::memory_order_relaxed);
    Cell* cell = nullptr;
    for (;;) {
      cell = &cells_[pos & mask_];
      const std::size_t seq = cell->seq.load(std::memory_order_acquire);
      const auto dif = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos + 1);
      if (dif == 0) {
        if (dequeue_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) break;
      } else if (dif < 0) {
        return false; // empty
      } else {
        pos = dequeue_pos_.load(std::memory_order_relaxed);
      }
    }
    out = std::move(cell->value);
    cell->value = T{};
    cell->seq.store(pos + mask_ + 1, std::memory_order_release);
    return true;
  }

  /// @brief True if queue is empty (observer, not linearizable).
  bool empty() const noexcept { return approx_size() == 0; }

  /// @brief Capacity (power-of-two).
  std::size_t capacity() const noexcept { return capacity_; }

  /// @brief Approximate size (not linearizable across threads).
  std::size_t approx_size() const noexcept {
    const auto t = enqueue_pos_.load(std::memory_order_acquire);
    const auto h = dequeue_pos_.load(std::memory_order_acquire);
    return t >= h ? t - h : 0;
  }

private:
  /// @brief Reserve the next enqueue cell; @p pos receives its ticket.
  Cell* claim_enqueue(std::size_t& pos) noexcept {
    if (!cells_) return nullptr;
    pos = enqueue_pos_.load(std::memory_order_relaxed);
    for (;;) {
      Cell* cell = &cells_[pos & mask_];
      const std::size_t seq = cell->seq.load(std::memory_order_acquire);
      const auto dif = static_cast<std::intptr_t>(seq) - static_cast<std::intptr_t>(pos);
      if (dif == 0) {
        if (enqueue_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          return cell;
        }
      } else if (dif < 0) {
        return nullptr;
      } else {
        pos = enqueue_pos_.load(std::memory_order_relaxed);
      }
    }
  }

  /// @brief Helper to implement noexcept move.
  void move_from(BoundedQueue&& other) noexcept {
    enqueue_pos_.store(other.enqueue_pos_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    dequeue_pos_.store(other.dequeue_pos_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    capacity_ = other.capacity_;
    mask_     = other.mask_;
    cells_    = std::move(other.cells_);
    other.capacity_ = 0;
    other.mask_     = 0;
  }

  // Producer/consumer indices on separate cache lines (avoid false sharing)
  alignas(kCacheLine) std::atomic<std::size_t> enqueue_pos_{0}; ///< Producer index
  alignas(kCacheLine) std::atomic<std::size_t> dequeue_pos_{0}; ///< Consumer index

  // Read-mostly metadata and owning storage
  alignas(kCacheLine) std::unique_ptr<Cell[]> cells_{};  ///< Owning cell storage
  std::size_t                                 capacity_ = 0;
  std::size_t                                 mask_     = 0;
};

} // namespace vox::mem
