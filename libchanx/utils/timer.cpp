#include <string>
#include <vector>
#include <limits>
#include <assert.h>
#include <stdio.h>
#include <time.h>

#include "timer.hpp"


namespace chanx {


static std::string TimeUnitStr(TimeUnit unit) {
    switch (unit) {
    case TIME_NANO:  return "ns";
    case TIME_MICRO: return "us";
    case TIME_MILLI: return "ms";
    case TIME_SEC:   return "s";
    default:         return "unknown_unit";
    }
}

static double TimeUnitDiv(TimeUnit unit) {
    switch (unit) {
    case TIME_NANO:  return 1;
    case TIME_MICRO: return 1e3;
    case TIME_MILLI: return 1e6;
    case TIME_SEC:   return 1e9;
    default:
        assert(false);
        return 1;
    }
}


void Timer::Reset() {
    nanosecs.clear();
    opcounts.clear();
    started = false;
}


void Timer::Start() {
    assert(!started);
    [[maybe_unused]] int ret = clock_gettime(CLOCK_MONOTONIC, &start_ts);
    assert(ret == 0);
    started = true;
}

void Timer::Pause(uint64_t ops) {
    assert(started);
    [[maybe_unused]] int ret = clock_gettime(CLOCK_MONOTONIC, &pause_ts);
    assert(ret == 0);
    started = false;

    uint64_t nsecs = (pause_ts.tv_sec - start_ts.tv_sec) * 1000000000ul
                     + (pause_ts.tv_nsec - start_ts.tv_nsec);
    nanosecs.push_back(nsecs);
    opcounts.push_back(ops);
}


size_t Timer::GetSize() const {
    assert(!started);
    return nanosecs.size();
}

std::vector<double> Timer::GetStat(TimeUnit unit) const {
    assert(!started);
    double div = TimeUnitDiv(unit);

    std::vector<double> stat;
    stat.reserve(nanosecs.size());
    for (uint64_t nsecs : nanosecs)
        stat.push_back(static_cast<double>(nsecs) / div);

    return stat;
}

double Timer::GetThroughput() const {
    assert(!started);
    uint64_t total_ns = 0, total_ops = 0;
    for (size_t i = 0; i < nanosecs.size(); ++i) {
        total_ns += nanosecs[i];
        total_ops += opcounts[i];
    }
    if (total_ns == 0)
        return 0.;
    return static_cast<double>(total_ops) * 1e9 / total_ns;
}


void Timer::ShowStat(TimeUnit unit) const {
    std::vector<double> stat = GetStat(unit);

    if (stat.size() > 0) {
        double sum = 0., max = std::numeric_limits<double>::min(),
                         min = std::numeric_limits<double>::max();
        for (double& time : stat) {
            sum += time;
            max = time > max ? time : max;
            min = time < min ? time : min;
        }
        double avg = sum / stat.size();
        fprintf(stderr, "# %-24s #  cnt %5lu  "
                        "avg %10.3lf  max %10.3lf  min %10.3lf  %s  "
                        "tput %12.1lf ops/s\n",
               id.c_str(), stat.size(), avg, max, min,
               TimeUnitStr(unit).c_str(), GetThroughput());
    } else
        fprintf(stderr, "# %-24s #  cnt %5lu\n", id.c_str(), 0lu);
}


}
