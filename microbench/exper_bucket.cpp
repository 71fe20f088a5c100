#include <vector>
#include <thread>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <cstdint>
#include <stdio.h>

#include "token_bucket.hpp"
#include "timer.hpp"
#include "exper_impl.hpp"


// Every thread does num_tries / num_threads acquires, releasing each
// granted token right away so the bucket keeps cycling.
static size_t do_tries_bucket(chanx::TokenBucket& bucket, size_t num_threads,
                              size_t num_tries) {
    std::atomic<size_t> granted = 0;
    std::vector<std::thread> threads;
    for (size_t id = 0; id < num_threads; ++id) {
        threads.emplace_back([&, id]() {
            size_t beg, end;
            split_range(num_tries, num_threads, id, beg, end);
            size_t mine = 0;
            for (size_t i = beg; i < end; ++i) {
                if (bucket.TryAcquire()) {
                    mine++;
                    bucket.Release();
                }
            }
            granted += mine;
        });
    }
    for (auto& thread : threads)
        thread.join();

    if (bucket.InFlight() != 0)
        throw std::runtime_error("token bucket leaked tokens");
    return granted.load();
}


void run_exper_bucket(chanx::TokenBucketType type, uint32_t capacity,
                      size_t num_threads, size_t num_tries,
                      chanx::Timer& timer,
                      size_t timing_rounds, size_t warmup_rounds) {
    std::unique_ptr<chanx::TokenBucket> bucket =
        chanx::NewTokenBucket(type, capacity);

    for (size_t i = 0; i < warmup_rounds; ++i)
        do_tries_bucket(*bucket, num_threads, num_tries);

    size_t granted = 0;
    for (size_t i = 0; i < timing_rounds; ++i) {
        TIMER_START(timer);
        granted += do_tries_bucket(*bucket, num_threads, num_tries);
        TIMER_PAUSE(timer, num_tries);
    }

    printf("Bucket %s granted %lu / %lu tries\n",
           chanx::TokenBucketTypeStr(type), granted,
           num_tries * timing_rounds);
}
