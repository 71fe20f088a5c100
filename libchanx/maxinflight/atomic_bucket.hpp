#include <atomic>
#include <cstdint>

#include "token_bucket.hpp"


#pragma once


namespace chanx {


// Lock-free bucket. The count is a wider signed type than the capacity so
// that speculative increments never overflow, and it may transiently dip
// below zero when releases race with a shrinking Resize(); such negative
// counts are corrected on the next acquire.
class AtomicTokenBucket : public TokenBucket {
    protected:
        std::atomic<uint32_t> max;
        std::atomic<int64_t> count;

    public:
        AtomicTokenBucket() = delete;
        AtomicTokenBucket(uint32_t n);
        ~AtomicTokenBucket() {}

        bool TryAcquire() override;
        void Release() override;
        void Resize(uint32_t n) override;

        int64_t InFlight() const override;
        TokenBucketType Type() const override { return BUCKET_ATOMIC; }
};


}
