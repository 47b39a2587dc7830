/**
 * @file process_stats.cpp
 * @brief Resident memory and CPU time probes
 */

#include "crdtperf/core/process_stats.h"
#include <algorithm>
#include <cstdio>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/resource.h>
#include <unistd.h>
#endif

namespace crdtperf::core {

namespace {

Real read_resident_memory_mb() {
#if defined(__linux__)
    std::FILE* file = std::fopen("/proc/self/statm", "r");
    if (file) {
        unsigned long size = 0;
        unsigned long resident = 0;
        int fields = std::fscanf(file, "%lu %lu", &size, &resident);
        std::fclose(file);
        if (fields == 2) {
            const long page_size = sysconf(_SC_PAGESIZE);
            return static_cast<Real>(resident) * static_cast<Real>(page_size) / (1024.0 * 1024.0);
        }
    }
#endif
#if defined(__unix__) || defined(__APPLE__)
    struct rusage usage {};
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
#if defined(__APPLE__)
        return static_cast<Real>(usage.ru_maxrss) / (1024.0 * 1024.0);
#else
        return static_cast<Real>(usage.ru_maxrss) / 1024.0;
#endif
    }
#endif
    return 0.0;
}

Real read_cpu_time_seconds() {
#if defined(__unix__) || defined(__APPLE__)
    struct rusage usage {};
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        auto to_sec = [](const timeval& tv) {
            return static_cast<Real>(tv.tv_sec) + static_cast<Real>(tv.tv_usec) / 1e6;
        };
        return to_sec(usage.ru_utime) + to_sec(usage.ru_stime);
    }
#endif
    return 0.0;
}

} // anonymous namespace

ResourceReading read_process_resources() {
    ResourceReading reading;
    reading.resident_memory_mb = read_resident_memory_mb();
    reading.cpu_time_seconds = read_cpu_time_seconds();
    reading.taken_at = SteadyClock::now();
    return reading;
}

Real cpu_percent_between(const ResourceReading& start, const ResourceReading& end) {
    const Real wall = to_seconds(end.taken_at - start.taken_at);
    if (wall <= 0.0) {
        return 0.0;
    }
    const Real cpu = std::max(0.0, end.cpu_time_seconds - start.cpu_time_seconds);
    return cpu / wall * 100.0;
}

Real memory_growth_mb(const ResourceReading& start, const ResourceReading& end) {
    return std::max(0.0, end.resident_memory_mb - start.resident_memory_mb);
}

} // namespace crdtperf::core
