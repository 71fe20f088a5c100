#include <cstdint>

#include "debug.hpp"
#include "chan.hpp"
#include "channel_bucket.hpp"


namespace chanx {


ChannelTokenBucket::ChannelTokenBucket(uint32_t n)
        : ch(n) {
}


bool ChannelTokenBucket::TryAcquire() {
    bool token = true;
    return ch.TrySend(token) == CHAN_OK;
}

void ChannelTokenBucket::Release() {
    bool token;
    [[maybe_unused]] ChanStatus status = ch.TryRecv(token);
    assert(status != CHAN_CLOSED);
}

void ChannelTokenBucket::Resize(uint32_t n) {
    DEBUG("channel token bucket can not be resized to %u, keeping %lu\n",
          n, ch.Cap());
}


int64_t ChannelTokenBucket::InFlight() const {
    return static_cast<int64_t>(ch.Len());
}


}
