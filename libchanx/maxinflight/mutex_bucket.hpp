#include <mutex>
#include <cstdint>

#include "token_bucket.hpp"


#pragma once


namespace chanx {


// Plain counter under a mutex. Resize() is serialized against acquire and
// release, at the cost of lock contention.
class MutexTokenBucket : public TokenBucket {
    private:
        mutable std::mutex mu;
        int64_t count = 0;
        uint32_t max = 0;

    public:
        MutexTokenBucket() = delete;
        MutexTokenBucket(uint32_t n);
        ~MutexTokenBucket() {}

        bool TryAcquire() override;
        void Release() override;
        void Resize(uint32_t n) override;

        int64_t InFlight() const override;
        TokenBucketType Type() const override { return BUCKET_MUTEX; }
};


}
