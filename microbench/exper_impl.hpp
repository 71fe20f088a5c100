#include <vector>
#include <exception>
#include <string>
#include <cstdint>

#include "timer.hpp"
#include "token_bucket.hpp"


#ifndef __EXPER_IMPL_H__
#define __EXPER_IMPL_H__


// Sizes shared by all channel-like experiments.
struct ChanParams {
    size_t num_msgs;
    size_t num_producers;
    size_t in_size;         // also the capacity of plain channels
    size_t out_size;
    size_t init_buf;
    size_t max_buf;

    ChanParams(size_t num_msgs, size_t num_producers, size_t in_size,
               size_t out_size, size_t init_buf, size_t max_buf)
        : num_msgs(num_msgs), num_producers(num_producers), in_size(in_size),
          out_size(out_size), init_buf(init_buf), max_buf(max_buf) {}
};


// Each run records one timer round per timing round, covering num_msgs
// messages (or num_tries acquires for the bucket experiment).

void run_exper_chan(const ChanParams& params, chanx::Timer& timer,
                    size_t timing_rounds, size_t warmup_rounds);

void run_exper_pipe(const ChanParams& params, chanx::Timer& timer,
                    size_t timing_rounds, size_t warmup_rounds);

void run_exper_chanx(const ChanParams& params, chanx::Timer& timer,
                     size_t timing_rounds, size_t warmup_rounds);

void run_exper_queue(const ChanParams& params, chanx::Timer& timer,
                     size_t timing_rounds, size_t warmup_rounds);

void run_exper_bucket(chanx::TokenBucketType type, uint32_t capacity,
                      size_t num_threads, size_t num_tries,
                      chanx::Timer& timer,
                      size_t timing_rounds, size_t warmup_rounds);


// Split num_msgs among num_producers, producer id gets [beg, end).
void split_range(size_t num_msgs, size_t num_producers, size_t id,
                 size_t& beg, size_t& end);

// Worker threads park their failure in their own slot; the spawning
// thread rethrows the first one after joining all of them.
void rethrow_first(const std::vector<std::exception_ptr>& errors);


#endif
