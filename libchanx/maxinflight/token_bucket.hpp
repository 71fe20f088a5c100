#include <iostream>
#include <memory>
#include <string>
#include <cstdint>


#pragma once


namespace chanx {


// Concurrency strategy backing a TokenBucket.
typedef enum TokenBucketType {
    BUCKET_ATOMIC,
    BUCKET_CHANNEL,
    BUCKET_MUTEX,
    BUCKET_INFINITY
} TokenBucketType;

const char *TokenBucketTypeStr(TokenBucketType type);
std::ostream& operator<<(std::ostream& s, TokenBucketType type);

// Parse one of "atomic", "channel", "mutex", "infinity". Throws
// std::invalid_argument on anything else.
TokenBucketType ParseTokenBucketType(const std::string& name);


// General interface of a max-in-flight limiter: bounds the number of
// outstanding operations, never blocks the caller.
class TokenBucket {
    public:
        TokenBucket() {}
        virtual ~TokenBucket() {}

        // Take one token if one is available right now. Returns false
        // immediately otherwise; that is a normal outcome under load.
        virtual bool TryAcquire() = 0;

        // Give one token back. A no-op when nothing is outstanding.
        virtual void Release() = 0;

        // Change the capacity. Tokens already out are not revoked, only
        // future TryAcquire()s see the new bound.
        virtual void Resize(uint32_t n) = 0;

        // Number of tokens currently out, for diagnostics.
        [[nodiscard]] virtual int64_t InFlight() const = 0;

        [[nodiscard]] virtual TokenBucketType Type() const = 0;
};


// Bucket of the default strategy (atomic) with the given capacity.
std::unique_ptr<TokenBucket> NewTokenBucket(uint32_t size);

std::unique_ptr<TokenBucket> NewTokenBucket(TokenBucketType type,
                                            uint32_t size);

// Process-wide bucket that never refuses.
TokenBucket& InfinityBucket();


}
