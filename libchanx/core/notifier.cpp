#include <mutex>
#include <condition_variable>
#include <chrono>

#include "notifier.hpp"


namespace chanx {


uint64_t Notifier::Epoch() {
    std::lock_guard<std::mutex> lk(mu);
    return epoch;
}

void Notifier::Notify() {
    {
        std::lock_guard<std::mutex> lk(mu);
        epoch++;
    }
    cv.notify_all();
}

void Notifier::WaitChange(uint64_t seen) {
    std::unique_lock<std::mutex> lk(mu);
    cv.wait(lk, [&]() { return epoch != seen; });
}

bool Notifier::WaitChangeUntil(uint64_t seen,
                               std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mu);
    return cv.wait_until(lk, deadline, [&]() { return epoch != seen; });
}


}
