#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tg::prof {

struct Sample { std::string name; double ms = 0.0; };

// Process-wide timing store. Each name keeps running totals plus a ring of its
// most recent window_size samples, so memory stays bounded however often a
// scope runs. Percentiles are computed over that window.
class Accumulator {
public:
    static constexpr size_t window_size = 512;

    static Accumulator& instance();
    void add(Sample s);
    // Retained samples, grouped by name, oldest first within a name
    std::vector<Sample> snapshot();

    struct Stats {
        size_t count = 0;
        double total_ms = 0.0;
        double min_ms = 0.0;
        double max_ms = 0.0;
        double avg_ms = 0.0;
        double p50_ms = 0.0;
        double p95_ms = 0.0;
    };
    std::unordered_map<std::string, Stats> aggregate();

    // Logs one info line per sample name.
    void report();
    void clear();

private:
    struct Series {
        size_t count = 0;
        double total_ms = 0.0;
        double min_ms = 0.0;
        double max_ms = 0.0;
        std::vector<double> recent;
        size_t next = 0; // ring write position once recent is full
    };

    std::mutex mtx_;
    std::unordered_map<std::string, Series> series_;
};

class ScopedTimer {
public:
    explicit ScopedTimer(const char* name) : name_(name), start_(Clock::now()) {}
    ~ScopedTimer();
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;
private:
    using Clock = std::chrono::steady_clock;
    const char* name_;
    Clock::time_point start_;
};

} // namespace tg::prof

#define TG_PP_CAT(a,b) TG_PP_CAT_INNER(a,b)
#define TG_PP_CAT_INNER(a,b) a##b

#ifndef TG_ENABLE_PROFILING
#define TG_ENABLE_PROFILING 1
#endif

#if TG_ENABLE_PROFILING
#define TG_PROFILE_SCOPE(name) ::tg::prof::ScopedTimer TG_PP_CAT(tg_prof_scope_, __COUNTER__){name}
#else
#define TG_PROFILE_SCOPE(name) do{}while(0)
#endif
