#include <thread>
#include <atomic>
#include <vector>
#include <string>
#include <memory>
#include <limits>
#include <stdexcept>
#include <cstdint>

#include <gtest/gtest.h>

#include "debug.hpp"
#include "token_bucket.hpp"
#include "atomic_bucket.hpp"
#include "channel_bucket.hpp"
#include "mutex_bucket.hpp"
#include "infinity_bucket.hpp"


namespace chanx {


// Hammer bucket from many threads without ever releasing; returns the
// number of successful acquires.
static uint64_t AcquireConcurrently(TokenBucket& bucket, int num_threads,
                                    int tries_per_thread) {
    std::atomic<uint64_t> succeeded = 0;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < tries_per_thread; ++i) {
                if (bucket.TryAcquire())
                    succeeded++;
            }
        });
    }
    for (auto& thread : threads)
        thread.join();
    return succeeded.load();
}


class TokenBucketStrategyTest
    : public ::testing::TestWithParam<TokenBucketType> {};

TEST_P(TokenBucketStrategyTest, ConcurrentAcquireIsBounded) {
    std::unique_ptr<TokenBucket> bucket = NewTokenBucket(GetParam(), 10000);
    ASSERT_EQ(bucket->Type(), GetParam());

    EXPECT_EQ(AcquireConcurrently(*bucket, 64, 500), 10000u);
    EXPECT_EQ(bucket->InFlight(), 10000);
    EXPECT_FALSE(bucket->TryAcquire());
}

TEST_P(TokenBucketStrategyTest, ReleaseMakesRoom) {
    std::unique_ptr<TokenBucket> bucket = NewTokenBucket(GetParam(), 2);
    EXPECT_TRUE(bucket->TryAcquire());
    EXPECT_TRUE(bucket->TryAcquire());
    EXPECT_FALSE(bucket->TryAcquire());

    bucket->Release();
    EXPECT_EQ(bucket->InFlight(), 1);
    EXPECT_TRUE(bucket->TryAcquire());
    EXPECT_FALSE(bucket->TryAcquire());
}

TEST_P(TokenBucketStrategyTest, ReleaseWhenIdleIsNoop) {
    std::unique_ptr<TokenBucket> bucket = NewTokenBucket(GetParam(), 1);
    bucket->Release();
    bucket->Release();
    EXPECT_EQ(bucket->InFlight(), 0);
    EXPECT_TRUE(bucket->TryAcquire());
    EXPECT_FALSE(bucket->TryAcquire());
}

TEST_P(TokenBucketStrategyTest, ZeroCapacityRefuses) {
    std::unique_ptr<TokenBucket> bucket = NewTokenBucket(GetParam(), 0);
    EXPECT_FALSE(bucket->TryAcquire());
    EXPECT_EQ(bucket->InFlight(), 0);
}

TEST_P(TokenBucketStrategyTest, ConcurrentAcquireRelease) {
    std::unique_ptr<TokenBucket> bucket = NewTokenBucket(GetParam(), 8);
    std::atomic<int64_t> outstanding = 0;
    std::atomic<int64_t> peak = 0;

    std::vector<std::thread> threads;
    for (int t = 0; t < 16; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 2000; ++i) {
                if (!bucket->TryAcquire())
                    continue;
                int64_t now = ++outstanding;
                int64_t seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
                --outstanding;
                bucket->Release();
            }
        });
    }
    for (auto& thread : threads)
        thread.join();

    EXPECT_LE(peak.load(), 8);
    EXPECT_EQ(bucket->InFlight(), 0);
}

INSTANTIATE_TEST_SUITE_P(
    Bounded, TokenBucketStrategyTest,
    ::testing::Values(BUCKET_ATOMIC, BUCKET_CHANNEL, BUCKET_MUTEX));


TEST(TokenBucketTest, DefaultStrategyIsAtomic) {
    std::unique_ptr<TokenBucket> bucket = NewTokenBucket(3);
    EXPECT_EQ(bucket->Type(), BUCKET_ATOMIC);
}

TEST(TokenBucketTest, ResizeGrows) {
    for (TokenBucketType type : {BUCKET_ATOMIC, BUCKET_MUTEX}) {
        std::unique_ptr<TokenBucket> bucket = NewTokenBucket(type, 1);
        EXPECT_TRUE(bucket->TryAcquire());
        EXPECT_FALSE(bucket->TryAcquire()) << type;

        bucket->Resize(3);
        EXPECT_TRUE(bucket->TryAcquire()) << type;
        EXPECT_TRUE(bucket->TryAcquire()) << type;
        EXPECT_FALSE(bucket->TryAcquire()) << type;
    }
}

TEST(TokenBucketTest, ResizeShrinksWithoutRevoking) {
    for (TokenBucketType type : {BUCKET_ATOMIC, BUCKET_MUTEX}) {
        std::unique_ptr<TokenBucket> bucket = NewTokenBucket(type, 3);
        for (int i = 0; i < 3; ++i)
            EXPECT_TRUE(bucket->TryAcquire());

        bucket->Resize(1);
        EXPECT_EQ(bucket->InFlight(), 3) << type;
        EXPECT_FALSE(bucket->TryAcquire()) << type;

        bucket->Release();
        bucket->Release();
        EXPECT_FALSE(bucket->TryAcquire()) << type;
        bucket->Release();
        EXPECT_TRUE(bucket->TryAcquire()) << type;
        EXPECT_FALSE(bucket->TryAcquire()) << type;
    }
}

TEST(TokenBucketTest, ChannelResizeIsNoop) {
    std::unique_ptr<TokenBucket> bucket = NewTokenBucket(BUCKET_CHANNEL, 1);
    bucket->Resize(5);
    EXPECT_TRUE(bucket->TryAcquire());
    EXPECT_FALSE(bucket->TryAcquire());
}

TEST(TokenBucketTest, InfinityAlwaysGrants) {
    std::unique_ptr<TokenBucket> bucket = NewTokenBucket(BUCKET_INFINITY, 0);
    EXPECT_EQ(bucket->Type(), BUCKET_INFINITY);
    EXPECT_EQ(AcquireConcurrently(*bucket, 8, 1000), 8000u);
    bucket->Resize(1);
    EXPECT_TRUE(bucket->TryAcquire());
    bucket->Release();
    EXPECT_EQ(bucket->InFlight(), 0);
}

TEST(TokenBucketTest, SharedInfinityBucket) {
    TokenBucket& a = InfinityBucket();
    TokenBucket& b = InfinityBucket();
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.Type(), BUCKET_INFINITY);
    EXPECT_TRUE(a.TryAcquire());
}

TEST(TokenBucketTest, TypeNames) {
    for (TokenBucketType type : {BUCKET_ATOMIC, BUCKET_CHANNEL,
                                 BUCKET_MUTEX, BUCKET_INFINITY})
        EXPECT_EQ(ParseTokenBucketType(TokenBucketTypeStr(type)), type);
    EXPECT_EQ(StreamStr(BUCKET_CHANNEL), "channel");
    EXPECT_THROW(ParseTokenBucketType("semaphore"), std::invalid_argument);
    EXPECT_THROW(ParseTokenBucketType(""), std::invalid_argument);
}


// Atomic bucket with its counter exposed, to set up counts that are hard
// to reach through the public interface.
class CountedAtomicBucket : public AtomicTokenBucket {
    public:
        CountedAtomicBucket(uint32_t n) : AtomicTokenBucket(n) {}

        void SetCount(int64_t c) { count.store(c); }
        [[nodiscard]] int64_t Count() const { return count.load(); }
};

TEST(AtomicTokenBucketTest, NearUint32Limit) {
    constexpr uint32_t max = std::numeric_limits<uint32_t>::max();
    CountedAtomicBucket bucket(max);
    bucket.SetCount(static_cast<int64_t>(max) - 10);

    EXPECT_EQ(AcquireConcurrently(bucket, 4, 10), 10u);
    EXPECT_EQ(bucket.Count(), static_cast<int64_t>(max));
    EXPECT_FALSE(bucket.TryAcquire());
}

TEST(AtomicTokenBucketTest, NegativeCountResets) {
    CountedAtomicBucket bucket(2);
    bucket.SetCount(-5);
    EXPECT_EQ(bucket.InFlight(), 0);

    EXPECT_TRUE(bucket.TryAcquire());
    EXPECT_EQ(bucket.Count(), 1);
    EXPECT_TRUE(bucket.TryAcquire());
    EXPECT_FALSE(bucket.TryAcquire());
}

TEST(AtomicTokenBucketTest, NegativeCountStillRefusesAtZeroCapacity) {
    CountedAtomicBucket bucket(0);
    bucket.SetCount(-1);
    EXPECT_FALSE(bucket.TryAcquire());
    EXPECT_EQ(bucket.Count(), -1);
}

TEST(AtomicTokenBucketTest, ReleaseNeverGoesNegative) {
    CountedAtomicBucket bucket(4);
    bucket.SetCount(1);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
        threads.emplace_back([&]() { bucket.Release(); });
    for (auto& thread : threads)
        thread.join();
    EXPECT_GE(bucket.Count(), 0);
}


}
