#include <mutex>
#include <cstdint>

#include "debug.hpp"
#include "mutex_bucket.hpp"


namespace chanx {


MutexTokenBucket::MutexTokenBucket(uint32_t n)
        : count(0), max(n) {
}


bool MutexTokenBucket::TryAcquire() {
    std::lock_guard<std::mutex> lk(mu);
    if (count >= static_cast<int64_t>(max))
        return false;
    count++;
    return true;
}

void MutexTokenBucket::Release() {
    std::lock_guard<std::mutex> lk(mu);
    if (count == 0)
        return;
    count--;
}

void MutexTokenBucket::Resize(uint32_t n) {
    std::lock_guard<std::mutex> lk(mu);
    if (max != n) {
        DEBUG("mutex token bucket resized %u -> %u\n", max, n);
        max = n;
    }
}


int64_t MutexTokenBucket::InFlight() const {
    std::lock_guard<std::mutex> lk(mu);
    return count;
}


}
