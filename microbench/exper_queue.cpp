#include <vector>
#include <thread>
#include <atomic>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <cstdint>

#include <concurrentqueue/blockingconcurrentqueue.h>

#include "timer.hpp"
#include "exper_impl.hpp"


// Lock-free MPMC queue as the baseline. It has no close, so the consumer
// counts up to num_msgs, or gives up once a producer failed.
static void do_msgs_queue(const ChanParams& params) {
    moodycamel::BlockingConcurrentQueue<uint64_t> queue(params.in_size);
    std::atomic<bool> aborted = false;

    std::thread consumer([&]() {
        uint64_t v;
        size_t received = 0;
        while (received < params.num_msgs && !aborted.load()) {
            if (queue.wait_dequeue_timed(v, std::chrono::milliseconds(10)))
                received++;
        }
    });

    std::vector<std::thread> producers;
    std::vector<std::exception_ptr> errors(params.num_producers);
    for (size_t id = 0; id < params.num_producers; ++id) {
        producers.emplace_back([&, id]() {
            try {
                size_t beg, end;
                split_range(params.num_msgs, params.num_producers, id,
                            beg, end);
                for (size_t i = beg; i < end; ++i) {
                    if (!queue.enqueue(i))
                        throw std::runtime_error("queue failed to allocate");
                }
            } catch (const std::exception&) {
                errors[id] = std::current_exception();
                aborted = true;
            }
        });
    }
    for (auto& producer : producers)
        producer.join();
    consumer.join();
    rethrow_first(errors);
}


void run_exper_queue(const ChanParams& params, chanx::Timer& timer,
                     size_t timing_rounds, size_t warmup_rounds) {
    for (size_t i = 0; i < warmup_rounds; ++i)
        do_msgs_queue(params);

    for (size_t i = 0; i < timing_rounds; ++i) {
        TIMER_START(timer);
        do_msgs_queue(params);
        TIMER_PAUSE(timer, params.num_msgs);
    }
}
