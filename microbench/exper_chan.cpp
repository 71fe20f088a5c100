#include <vector>
#include <thread>
#include <atomic>
#include <exception>
#include <stdexcept>
#include <cstdint>

#include "chan.hpp"
#include "timer.hpp"
#include "exper_impl.hpp"


void split_range(size_t num_msgs, size_t num_producers, size_t id,
                 size_t& beg, size_t& end) {
    size_t per_producer = num_msgs / num_producers;
    beg = id * per_producer;
    end = (id == num_producers - 1) ? num_msgs : beg + per_producer;
}

void rethrow_first(const std::vector<std::exception_ptr>& errors) {
    for (const auto& error : errors) {
        if (error)
            std::rethrow_exception(error);
    }
}


// Producers push [0, num_msgs) into tx, then the last one out closes it.
// Returns the per-producer failures, to be rethrown once all threads of
// the experiment are joined.
static std::vector<std::exception_ptr> produce_into(chanx::Chan<uint64_t>& tx, const ChanParams& params) {
    std::vector<std::thread> producers;
    std::vector<std::exception_ptr> errors(params.num_producers);
    std::atomic<size_t> remaining = params.num_producers;
    for (size_t id = 0; id < params.num_producers; ++id) {
        producers.emplace_back([&, id]() {
            try {
                size_t beg, end;
                split_range(params.num_msgs, params.num_producers, id,
                            beg, end);
                for (size_t i = beg; i < end; ++i) {
                    if (!tx.Send(i))
                        throw std::runtime_error("channel closed under producer");
                }
            } catch (const std::exception&) {
                errors[id] = std::current_exception();
            }
            // close even on failure so that the consumer side ends
            if (--remaining == 0)
                tx.Close();
        });
    }
    for (auto& producer : producers)
        producer.join();
    return errors;
}

static size_t consume_from(chanx::Chan<uint64_t>& rx) {
    size_t received = 0;
    while (rx.Recv().has_value())
        received++;
    return received;
}


static void do_msgs_chan(const ChanParams& params) {
    chanx::Chan<uint64_t> ch(params.in_size);

    size_t received = 0;
    std::thread consumer([&]() { received = consume_from(ch); });
    std::vector<std::exception_ptr> errors = produce_into(ch, params);
    consumer.join();
    rethrow_first(errors);

    if (received != params.num_msgs)
        throw std::runtime_error("chan lost messages");
}

static void do_msgs_pipe(const ChanParams& params) {
    chanx::Chan<uint64_t> in(params.in_size);
    chanx::Chan<uint64_t> out(params.out_size);

    std::thread forwarder([&]() {
        while (auto v = in.Recv()) {
            if (!out.Send(*v))
                break;
        }
        out.Close();
    });

    size_t received = 0;
    std::thread consumer([&]() { received = consume_from(out); });
    std::vector<std::exception_ptr> errors = produce_into(in, params);
    forwarder.join();
    consumer.join();
    rethrow_first(errors);

    if (received != params.num_msgs)
        throw std::runtime_error("pipe lost messages");
}


void run_exper_chan(const ChanParams& params, chanx::Timer& timer,
                    size_t timing_rounds, size_t warmup_rounds) {
    for (size_t i = 0; i < warmup_rounds; ++i)
        do_msgs_chan(params);

    for (size_t i = 0; i < timing_rounds; ++i) {
        TIMER_START(timer);
        do_msgs_chan(params);
        TIMER_PAUSE(timer, params.num_msgs);
    }
}

void run_exper_pipe(const ChanParams& params, chanx::Timer& timer,
                    size_t timing_rounds, size_t warmup_rounds) {
    for (size_t i = 0; i < warmup_rounds; ++i)
        do_msgs_pipe(params);

    for (size_t i = 0; i < timing_rounds; ++i) {
        TIMER_START(timer);
        do_msgs_pipe(params);
        TIMER_PAUSE(timer, params.num_msgs);
    }
}
