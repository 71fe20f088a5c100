#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>


#pragma once


namespace chanx {


// Wakes up a single waiter that polls several channels at once.
//
// Every state change on a watched channel bumps the epoch. The waiter reads
// Epoch() before polling its cases without blocking, and if none was ready
// sleeps in WaitChange() until the epoch moves past what it read. A change
// that lands between the poll and the sleep is therefore never missed.
class Notifier {
    private:
        std::mutex mu;
        std::condition_variable cv;
        uint64_t epoch = 0;

    public:
        Notifier() {}
        ~Notifier() {}

        Notifier(const Notifier&) = delete;
        Notifier& operator=(const Notifier&) = delete;

        [[nodiscard]] uint64_t Epoch();

        void Notify();

        // Block until Epoch() != seen.
        void WaitChange(uint64_t seen);

        // Same as above but gives up at the deadline. Returns false on
        // timeout.
        bool WaitChangeUntil(uint64_t seen,
                             std::chrono::steady_clock::time_point deadline);
};


}
