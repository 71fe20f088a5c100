#include <atomic>
#include <cstdint>

#include "debug.hpp"
#include "atomic_bucket.hpp"


namespace chanx {


AtomicTokenBucket::AtomicTokenBucket(uint32_t n)
        : max(n), count(0) {
}


bool AtomicTokenBucket::TryAcquire() {
    int64_t cnt = count.load();
    int64_t cap = static_cast<int64_t>(max.load());
    if (cap == 0)
        return false;

    if (cnt < 0) {
        // reset a drifted count to zero and take one in the same step
        if (count.compare_exchange_strong(cnt, 1))
            return true;
        // lost the race: someone else already moved count back to >= 0,
        // fall through to the regular increment
    } else if (cnt >= cap) {
        return false;
    }

    cnt = count.fetch_add(1) + 1;
    if (cnt > cap) {
        // overshot, roll back
        count.fetch_sub(1);
        return false;
    }
    return true;
}

void AtomicTokenBucket::Release() {
    if (count.load() <= 0)
        return;
    int64_t cnt = count.fetch_sub(1) - 1;
    if (cnt < 0)
        count.store(0);
}

void AtomicTokenBucket::Resize(uint32_t n) {
    if (max.load() != n) {
        DEBUG("atomic token bucket resized %u -> %u\n", max.load(), n);
        max.store(n);
    }
}


int64_t AtomicTokenBucket::InFlight() const {
    int64_t cnt = count.load();
    return cnt < 0 ? 0 : cnt;
}


}
