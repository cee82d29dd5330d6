/**
 * @file test_mem.cpp
 * @brief Tests for BoundedQueue<T>, RecyclablePool<T> and ChunkBlockPool.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <set>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>
#include <cstdint>

#include "vox/mem/bounded_queue.hpp"
#include "vox/mem/chunk_block_pool.hpp"
#include "vox/mem/recyclable_pool.hpp"

using vox::mem::BoundedQueue;
using vox::mem::ChunkBlockPool;
using vox::mem::QueueError;
using vox::mem::RecyclablePool;
using vox::world::BlockHandle;
using vox::world::ChunkBlocks;

namespace {

/// Scratch buffer with a visible "dirty" state.
struct ScratchBuffer {
  std::vector<int> data;
  int              resets{0};

  void reset() {
    data.clear();
    ++resets;
  }
};

RecyclablePool<ScratchBuffer> make_scratch_pool(std::size_t max_size) {
  return RecyclablePool<ScratchBuffer>([] { return std::make_unique<ScratchBuffer>(); }, max_size);
}

} // namespace

// ---------- BoundedQueue ----------

TEST(BoundedQueue, WithCapacity_Validation) {
  auto bad0 = BoundedQueue<int>::with_capacity(0);
  ASSERT_FALSE(bad0.has_value());
  EXPECT_EQ(bad0.error(), QueueError::CapacityTooSmall);
  auto badN = BoundedQueue<int>::with_capacity(100);
  ASSERT_FALSE(badN.has_value());
  EXPECT_EQ(badN.error(), QueueError::CapacityNotPowerOfTwo);
  auto ok = BoundedQueue<int>::with_capacity(1024);
  ASSERT_TRUE(ok);
  EXPECT_EQ(ok->capacity(), 1024u);
}

TEST(BoundedQueue, RoundUpPow2) {
  EXPECT_EQ(vox::mem::round_up_pow2(0), 2u);
  EXPECT_EQ(vox::mem::round_up_pow2(2), 2u);
  EXPECT_EQ(vox::mem::round_up_pow2(3), 4u);
  EXPECT_EQ(vox::mem::round_up_pow2(50), 64u);
}

TEST(BoundedQueue, SingleThread_FillWrapDrain) {
  constexpr std::size_t CAP = 8;
  auto qexp = BoundedQueue<int>::with_capacity(CAP);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);

  // every slot is usable
  for (int i = 0; i < int(CAP); ++i) EXPECT_TRUE(q.push(i));
  EXPECT_FALSE(q.push(999));

  for (int i = 0; i < 3; ++i) {
    int v{};
    ASSERT_TRUE(q.pop(v));
    EXPECT_EQ(v, i);
  }

  // push 3 (wrap)
  for (int i = 100; i < 103; ++i) EXPECT_TRUE(q.push(i));

  std::vector<int> out;
  int v{};
  while (q.pop(v)) out.push_back(v);
  std::vector<int> expected = {3,4,5,6,7,100,101,102};
  EXPECT_EQ(out, expected);
  EXPECT_TRUE(q.empty());
}

TEST(BoundedQueue, FailedPushLeavesValueIntact) {
  auto qexp = BoundedQueue<std::unique_ptr<int>>::with_capacity(2);
  ASSERT_TRUE(qexp);
  auto q = std::move(*qexp);
  ASSERT_TRUE(q.push(std::make_unique<int>(1)));
  ASSERT_TRUE(q.push(std::make_unique<int>(2)));

  auto third = std::make_unique<int>(3);
  EXPECT_FALSE(q.push(std::move(third)));
  ASSERT_TRUE(third);
  EXPECT_EQ(*third, 3);
}

/**
 * @test BoundedQueue_ManyProducersManyConsumers
 * @brief Every pushed value is popped exactly once with 4 producers / 4 consumers.
 */
TEST(BoundedQueue, ManyProducersManyConsumers) {
  constexpr std::size_t CAP = 64, PER_PRODUCER = 20000, PRODUCERS = 4, CONSUMERS = 4;
  auto qexp = BoundedQueue<std::uint32_t>::with_capacity(CAP);
  ASSERT_TRUE(qexp);
  auto q = std::make_shared<BoundedQueue<std::uint32_t>>(std::move(*qexp));

  std::atomic<std::size_t> consumed{0};
  std::vector<std::vector<std::uint32_t>> seen(CONSUMERS);

  std::vector<std::thread> threads;
  for (std::size_t p = 0; p < PRODUCERS; ++p) {
    threads.emplace_back([&, p]{
      for (std::size_t i = 0; i < PER_PRODUCER;) {
        const auto v = static_cast<std::uint32_t>(p * PER_PRODUCER + i);
        if (q->push(v)) ++i;
        else std::this_thread::yield();
      }
    });
  }
  for (std::size_t c = 0; c < CONSUMERS; ++c) {
    threads.emplace_back([&, c]{
      std::uint32_t v{};
      while (consumed.load(std::memory_order_relaxed) < PRODUCERS * PER_PRODUCER) {
        if (q->pop(v)) { seen[c].push_back(v); consumed.fetch_add(1, std::memory_order_relaxed); }
        else std::this_thread::yield();
      }
    });
  }
  for (auto& t : threads) t.join();

  std::vector<std::uint32_t> all;
  for (auto& s : seen) all.insert(all.end(), s.begin(), s.end());
  std::sort(all.begin(), all.end());
  ASSERT_EQ(all.size(), PRODUCERS * PER_PRODUCER);
  for (std::size_t i = 0; i < all.size(); ++i) EXPECT_EQ(all[i], i);
  EXPECT_TRUE(q->empty());
}

// ---------- RecyclablePool ----------

TEST(RecyclablePool, BorrowFromEmptyCreates) {
  auto pool = make_scratch_pool(4);
  auto a = pool.borrow();
  auto b = pool.borrow();
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_NE(a.get(), b.get());

  const auto s = pool.stats();
  EXPECT_EQ(s.borrowed, 2u);
  EXPECT_EQ(s.created, 2u);
  EXPECT_EQ(s.returned, 0u);
  EXPECT_EQ(s.in_use, 2);
  EXPECT_EQ(pool.size(), 0u);
}

TEST(RecyclablePool, ThrowingFactoryLeavesCountersUntouched) {
  int calls = 0;
  RecyclablePool<ScratchBuffer> pool(
      [&calls] {
        if (++calls == 1) throw std::runtime_error("out of scratch space");
        return std::make_unique<ScratchBuffer>();
      },
      4);

  EXPECT_THROW(pool.borrow(), std::runtime_error);
  auto s = pool.stats();
  EXPECT_EQ(s.borrowed, 0u);
  EXPECT_EQ(s.created, 0u);
  EXPECT_EQ(s.in_use, 0);

  auto obj = pool.borrow();
  ASSERT_TRUE(obj);
  s = pool.stats();
  EXPECT_EQ(s.borrowed, 1u);
  EXPECT_EQ(s.created, 1u);
  EXPECT_EQ(s.in_use, 1);

  pool.return_object(std::move(obj));
  EXPECT_EQ(pool.stats().in_use, 0);
}

TEST(RecyclablePool, ReturnThenBorrowReusesSameInstanceReset) {
  auto pool = make_scratch_pool(4);
  auto obj = pool.borrow();
  obj->data = {1, 2, 3};
  ScratchBuffer* raw = obj.get();

  pool.return_object(std::move(obj));
  EXPECT_EQ(pool.size(), 1u);

  auto again = pool.borrow();
  EXPECT_EQ(again.get(), raw);
  EXPECT_TRUE(again->data.empty());
  EXPECT_GE(again->resets, 1);

  const auto s = pool.stats();
  EXPECT_EQ(s.borrowed, 2u);
  EXPECT_EQ(s.created, 1u);   // second borrow did not construct
  EXPECT_EQ(s.returned, 1u);
  EXPECT_EQ(s.in_use, 1);
  EXPECT_EQ(pool.size(), 0u);
}

TEST(RecyclablePool, OverflowingReturnsAreDiscarded) {
  constexpr std::size_t M = 3;
  auto pool = make_scratch_pool(M);

  std::vector<RecyclablePool<ScratchBuffer>::Ptr> out;
  for (int i = 0; i < 10; ++i) out.push_back(pool.borrow());
  for (auto& p : out) pool.return_object(std::move(p));

  EXPECT_EQ(pool.size(), M);
  const auto s = pool.stats();
  EXPECT_EQ(s.returned, 10u);
  EXPECT_EQ(s.stored, M);
  EXPECT_EQ(s.max_size, M);
  EXPECT_EQ(s.in_use, 0);
}

TEST(RecyclablePool, NullReturnIsNoOp) {
  auto pool = make_scratch_pool(2);
  pool.return_object(nullptr);
  EXPECT_EQ(pool.size(), 0u);
  EXPECT_EQ(pool.stats().returned, 0u);
}

TEST(RecyclablePool, ZeroMaxSizeNeverStores) {
  auto pool = make_scratch_pool(0);
  pool.return_object(pool.borrow());
  EXPECT_EQ(pool.size(), 0u);
  EXPECT_EQ(pool.stats().returned, 1u);
}

TEST(RecyclablePool, ClearDropsIdleOnly) {
  auto pool = make_scratch_pool(4);
  auto held = pool.borrow();
  held->data = {42};
  pool.return_object(pool.borrow());
  pool.return_object(pool.borrow());
  ASSERT_EQ(pool.size(), 1u);  // second borrow reused the first return

  pool.clear();
  EXPECT_EQ(pool.size(), 0u);
  ASSERT_TRUE(held);
  EXPECT_EQ(held->data, std::vector<int>{42});

  // next borrow has to construct again
  const auto created_before = pool.stats().created;
  auto fresh = pool.borrow();
  EXPECT_EQ(pool.stats().created, created_before + 1);
}

TEST(RecyclablePool, ConcurrentBorrowReturnKeepsBounds) {
  constexpr std::size_t M = 8, THREADS = 8, ROUNDS = 5000;
  auto pool = make_scratch_pool(M);

  std::vector<std::thread> threads;
  std::atomic<bool> dirty_seen{false};
  for (std::size_t t = 0; t < THREADS; ++t) {
    threads.emplace_back([&]{
      for (std::size_t i = 0; i < ROUNDS; ++i) {
        auto obj = pool.borrow();
        if (!obj->data.empty()) dirty_seen.store(true);
        obj->data.push_back(static_cast<int>(i));
        pool.return_object(std::move(obj));
        if (pool.size() > M) dirty_seen.store(true);
      }
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_FALSE(dirty_seen.load());
  const auto s = pool.stats();
  EXPECT_EQ(s.borrowed, THREADS * ROUNDS);
  EXPECT_EQ(s.returned, THREADS * ROUNDS);
  EXPECT_EQ(s.in_use, 0);
  EXPECT_LE(s.stored, M);
  EXPECT_LE(s.created, THREADS * ROUNDS);
}

// ---------- ChunkBlockPool ----------

TEST(ChunkBlockPool, CreatePooledAttachesBlocks) {
  ChunkBlockPool pool(4);
  auto blocks = std::make_shared<const ChunkBlocks>();
  auto pooled = pool.create_pooled(blocks);
  ASSERT_TRUE(pooled);
  EXPECT_TRUE(pooled->has_blocks());
  EXPECT_EQ(pooled->blocks(), blocks);
}

TEST(ChunkBlockPool, ReturnDropsReferenceButKeepsSlot) {
  ChunkBlockPool pool(4);
  auto blocks = std::make_shared<const ChunkBlocks>();
  std::weak_ptr<const ChunkBlocks> watch = blocks;

  auto pooled = pool.create_pooled(std::move(blocks));
  auto* slot = pooled.get();
  pool.return_object(std::move(pooled));

  EXPECT_TRUE(watch.expired()) << "idle wrapper must not pin decoded data";
  EXPECT_EQ(pool.size(), 1u);

  auto again = pool.borrow();
  EXPECT_EQ(again.get(), slot);
  EXPECT_FALSE(again->has_blocks());
}

TEST(ChunkBlockPool, BlockByteSizeCountsAllArrays) {
  ChunkBlocks blocks;
  blocks.block_ids.resize(16);
  blocks.block_data.resize(16);
  blocks.biomes.resize(4);
  EXPECT_GE(blocks.byte_size(), 16 * sizeof(std::uint16_t) + 16 + 4);
}

TEST(ChunkBlockPool, StatsAndDescribe) {
  ChunkBlockPool pool(2);
  auto a = pool.borrow();
  auto b = pool.borrow();
  auto c = pool.borrow();
  pool.return_object(std::move(a));
  pool.return_object(std::move(b));
  pool.return_object(std::move(c));

  const auto s = pool.stats();
  EXPECT_EQ(s.stored, 2u);
  EXPECT_EQ(s.borrowed, 3u);
  EXPECT_EQ(s.returned, 3u);
  EXPECT_EQ(s.created, 3u);
  EXPECT_EQ(vox::mem::describe(s),
            "Pool Stats - Size: 2/2, Borrowed: 3, Returned: 3, Created: 3, In Use: 0");

  pool.clear();
  EXPECT_EQ(pool.size(), 0u);
}
