#include <iostream>
#include <vector>
#include <string>
#include <limits>
#include <stdexcept>
#include <cstdint>
#include <stdio.h>
#include <math.h>

#include "cxxopts.hpp"
#include "timer.hpp"
#include "token_bucket.hpp"
#include "exper_impl.hpp"


static void require_args(cxxopts::Options& options, cxxopts::ParseResult& args,
                         std::vector<std::string> required) {
    for (auto& s : required) {
        if (args.count(s) == 0) {
            std::cerr << options.help();
            throw std::runtime_error("some required argument(s) not given");
        }
    }
}


static void print_time_stat(const std::vector<double>& times_us) {
    if (times_us.empty()) {
        printf("Time elapsed stat: no rounds recorded\n");
        return;
    }

    double avg_us = 0.0,
           max_us = std::numeric_limits<double>::min(),
           min_us = std::numeric_limits<double>::max();
    for (const double& time : times_us) {
        avg_us += time;
        max_us = time > max_us ? time : max_us;
        min_us = time < min_us ? time : min_us;
    }
    avg_us /= times_us.size();

    double stddev = 0.0;
    for (const double& time : times_us)
        stddev += ((time - avg_us) * (time - avg_us)) / times_us.size();
    stddev = sqrt(stddev);

    printf("Time elapsed stat:\n");
    printf("  count   %lu\n", times_us.size());
    printf("  avg_us  %.3lf\n", avg_us);
    printf("  max_us  %.3lf\n", max_us);
    printf("  min_us  %.3lf\n", min_us);
    printf("  stddev  %.3lf\n", stddev);
}


static void run(int argc, char *argv[]) {
    // argument parsing & sanity check
    std::string mode, bucket_type;
    size_t num_msgs, num_producers, in_size, out_size, init_buf, max_buf,
           num_threads, bucket_cap, timing_rounds, warmup_rounds;

    cxxopts::Options options("chanxbench", "channel & limiter microbenchmark driver");
    options.add_options()
            ("h,help", "print help message", cxxopts::value<bool>())
            ("m,mode", "what to measure: chan|pipe|chanx|queue|bucket",
                       cxxopts::value<std::string>(mode))
            // channel workload
            ("n,num_msgs", "number of messages per round",
                           cxxopts::value<size_t>(num_msgs)->default_value("100000"))
            ("p,producers", "number of producer threads",
                            cxxopts::value<size_t>(num_producers)->default_value("1"))
            ("in_size", "input (or plain) channel capacity",
                        cxxopts::value<size_t>(in_size)->default_value("0"))
            ("out_size", "if pipe|chanx, output channel capacity",
                         cxxopts::value<size_t>(out_size)->default_value("0"))
            ("init_buf", "if chanx, initial ring buffer size",
                         cxxopts::value<size_t>(init_buf)->default_value("2"))
            ("max_buf", "if chanx, max ring buffer size, 0 for unbounded",
                        cxxopts::value<size_t>(max_buf)->default_value("0"))
            // limiter workload
            ("b,bucket", "if bucket, strategy: atomic|channel|mutex|infinity",
                         cxxopts::value<std::string>(bucket_type)->default_value("atomic"))
            ("c,bucket_cap", "if bucket, max in-flight tokens",
                             cxxopts::value<size_t>(bucket_cap)->default_value("64"))
            ("t,num_threads", "if bucket, number of acquiring threads",
                              cxxopts::value<size_t>(num_threads)->default_value("4"))
            // experiment
            ("tr", "number of timing rounds", cxxopts::value<size_t>(timing_rounds))
            ("wr", "number of warmup rounds", cxxopts::value<size_t>(warmup_rounds));
    auto args = options.parse(argc, argv);

    if (args.count("help")) {
        std::cout << options.help();
        return;
    }

    require_args(options, args, {"mode", "tr", "wr"});

    if (num_producers == 0 || num_threads == 0)
        throw std::runtime_error("need at least one producer/thread");
    if (num_msgs < num_producers)
        throw std::runtime_error("fewer messages than producers");
    if (bucket_cap > std::numeric_limits<uint32_t>::max())
        throw std::runtime_error("bucket capacity exceeds uint32 range");

    // carry out the experiment
    chanx::Timer timer(mode);
    ChanParams params(num_msgs, num_producers, in_size, out_size,
                      init_buf, max_buf);
    if (mode == "chan")
        run_exper_chan(params, timer, timing_rounds, warmup_rounds);
    else if (mode == "pipe")
        run_exper_pipe(params, timer, timing_rounds, warmup_rounds);
    else if (mode == "chanx")
        run_exper_chanx(params, timer, timing_rounds, warmup_rounds);
    else if (mode == "queue")
        run_exper_queue(params, timer, timing_rounds, warmup_rounds);
    else if (mode == "bucket") {
        chanx::TokenBucketType type = chanx::ParseTokenBucketType(bucket_type);
        run_exper_bucket(type, static_cast<uint32_t>(bucket_cap), num_threads,
                         num_msgs, timer, timing_rounds, warmup_rounds);
    } else {
        std::cerr << "Supported mode: chan|pipe|chanx|queue|bucket" << std::endl;
        throw std::runtime_error("unrecognized mode");
    }

    TIMER_PRINT(timer, chanx::TIME_MICRO);
    print_time_stat(timer.GetStat(chanx::TIME_MICRO));
}


int main(int argc, char *argv[]) {
    try {
        run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "chanxbench: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
