#include <memory>
#include <cstdint>

#include "chan.hpp"
#include "token_bucket.hpp"


#pragma once


namespace chanx {


// Bucket whose capacity is the buffer of a native channel: acquiring puts a
// token into it without blocking, releasing takes one out. The channel
// buffer can not change size, so Resize() is not supported and does
// nothing.
class ChannelTokenBucket : public TokenBucket {
    private:
        Chan<bool> ch;

    public:
        ChannelTokenBucket() = delete;
        ChannelTokenBucket(uint32_t n);
        ~ChannelTokenBucket() {}

        bool TryAcquire() override;
        void Release() override;
        void Resize(uint32_t n) override;

        int64_t InFlight() const override;
        TokenBucketType Type() const override { return BUCKET_CHANNEL; }
};


}
