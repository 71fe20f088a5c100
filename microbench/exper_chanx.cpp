#include <vector>
#include <thread>
#include <exception>
#include <stdexcept>
#include <cstdint>

#include "chan.hpp"
#include "channx.hpp"
#include "timer.hpp"
#include "exper_impl.hpp"


static void do_msgs_chanx(const ChanParams& params) {
    chanx::ChannX<uint64_t> cx(chanx::ChannXConfig()
                               .InChanSize(params.in_size)
                               .OutChanSize(params.out_size)
                               .InitBufferSize(params.init_buf)
                               .MaxBufferSize(params.max_buf));

    size_t received = 0;
    std::thread consumer([&]() {
        chanx::Receiver<uint64_t> out = cx.Out();
        while (out.Recv().has_value())
            received++;
    });

    std::vector<std::thread> producers;
    std::vector<std::exception_ptr> errors(params.num_producers);
    for (size_t id = 0; id < params.num_producers; ++id) {
        producers.emplace_back([&, id]() {
            try {
                chanx::Sender<uint64_t> in = cx.In();
                size_t beg, end;
                split_range(params.num_msgs, params.num_producers, id,
                            beg, end);
                for (size_t i = beg; i < end; ++i) {
                    if (!in.Send(i))
                        throw std::runtime_error("ChannX closed under producer");
                }
            } catch (const std::exception&) {
                errors[id] = std::current_exception();
            }
        });
    }
    for (auto& producer : producers)
        producer.join();

    // everything is sent, flush and let the consumer see the end
    cx.Close();
    consumer.join();
    rethrow_first(errors);

    if (received != params.num_msgs)
        throw std::runtime_error("ChannX lost messages");
}


void run_exper_chanx(const ChanParams& params, chanx::Timer& timer,
                     size_t timing_rounds, size_t warmup_rounds) {
    for (size_t i = 0; i < warmup_rounds; ++i)
        do_msgs_chanx(params);

    for (size_t i = 0; i < timing_rounds; ++i) {
        TIMER_START(timer);
        do_msgs_chanx(params);
        TIMER_PAUSE(timer, params.num_msgs);
    }
}
