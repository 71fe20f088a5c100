#include <cstdint>

#include "token_bucket.hpp"


#pragma once


namespace chanx {


// Bucket without a limit, for callers that need the TokenBucket interface
// but no admission control.
class InfinityTokenBucket : public TokenBucket {
    public:
        InfinityTokenBucket() {}
        ~InfinityTokenBucket() {}

        bool TryAcquire() override { return true; }
        void Release() override {}
        void Resize(uint32_t) override {}

        int64_t InFlight() const override { return 0; }
        TokenBucketType Type() const override { return BUCKET_INFINITY; }
};


}
