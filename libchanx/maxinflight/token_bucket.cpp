#include <iostream>
#include <memory>
#include <string>
#include <stdexcept>

#include "debug.hpp"
#include "token_bucket.hpp"
#include "atomic_bucket.hpp"
#include "channel_bucket.hpp"
#include "mutex_bucket.hpp"
#include "infinity_bucket.hpp"


namespace chanx {


const char *TokenBucketTypeStr(TokenBucketType type) {
    switch (type) {
    case BUCKET_ATOMIC:   return "atomic";
    case BUCKET_CHANNEL:  return "channel";
    case BUCKET_MUTEX:    return "mutex";
    case BUCKET_INFINITY: return "infinity";
    default:              return "unknown_bucket";
    }
}

std::ostream& operator<<(std::ostream& s, TokenBucketType type) {
    s << TokenBucketTypeStr(type);
    return s;
}

TokenBucketType ParseTokenBucketType(const std::string& name) {
    for (TokenBucketType type : {BUCKET_ATOMIC, BUCKET_CHANNEL,
                                 BUCKET_MUTEX, BUCKET_INFINITY}) {
        if (name == TokenBucketTypeStr(type))
            return type;
    }
    throw std::invalid_argument("unknown token bucket type '" + name + "'");
}


std::unique_ptr<TokenBucket> NewTokenBucket(uint32_t size) {
    return NewTokenBucket(BUCKET_ATOMIC, size);
}

std::unique_ptr<TokenBucket> NewTokenBucket(TokenBucketType type,
                                            uint32_t size) {
    switch (type) {
    case BUCKET_ATOMIC:
        return std::make_unique<AtomicTokenBucket>(size);
    case BUCKET_CHANNEL:
        return std::make_unique<ChannelTokenBucket>(size);
    case BUCKET_MUTEX:
        return std::make_unique<MutexTokenBucket>(size);
    case BUCKET_INFINITY:
        return std::make_unique<InfinityTokenBucket>();
    default:
        throw std::invalid_argument("unknown token bucket type "
                                    + std::to_string(type));
    }
}


TokenBucket& InfinityBucket() {
    static InfinityTokenBucket bucket;
    return bucket;
}


}
