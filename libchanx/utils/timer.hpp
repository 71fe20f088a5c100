#include <string>
#include <vector>
#include <cstdint>
#include <time.h>

#include "debug.hpp"


#pragma once


//////////////////
// Timer macros //
//////////////////

// Timer routines are not active if NTIMER is defined at compilation time
// by the build system.
#ifdef NTIMER

#define TIMER_START(timer)
#define TIMER_PAUSE(timer, ops)
#define TIMER_PRINT(timer, unit)
#define TIMER_RESET(timer)

#else

#define TIMER_START(timer)       timer.Start()
#define TIMER_PAUSE(timer, ops)  timer.Pause(ops)
#define TIMER_PRINT(timer, unit) timer.ShowStat(unit)
#define TIMER_RESET(timer)       timer.Reset()

#endif


////////////////////////////////////
// Timers internal implementation //
////////////////////////////////////

namespace chanx {


typedef enum TimeUnit {
    TIME_NANO,
    TIME_MICRO,
    TIME_MILLI,
    TIME_SEC
} TimeUnit;


// Accumulates timed rounds. Each round records its elapsed time together
// with the number of operations it covered, so throughput can be reported
// alongside latency.
class Timer {
    private:
        std::string id;

        struct timespec start_ts;
        struct timespec pause_ts;
        bool started = false;

        std::vector<uint64_t> nanosecs;
        std::vector<uint64_t> opcounts;

    public:
        Timer() = delete;
        Timer(std::string id) : id(id) {}
        ~Timer() {}

        void Reset();

        void Start();
        void Pause(uint64_t ops = 1);

        size_t GetSize() const;
        std::vector<double> GetStat(TimeUnit unit) const;

        // Operations per second over all recorded rounds.
        double GetThroughput() const;

        void ShowStat(TimeUnit unit) const;
};


}
