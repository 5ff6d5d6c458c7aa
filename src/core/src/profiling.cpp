#include "core/profiling.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cstdio>

namespace tg::prof {

Accumulator& Accumulator::instance() {
    static Accumulator inst;
    return inst;
}

void Accumulator::add(Sample s) {
    std::scoped_lock lock(mtx_);
    auto& series = series_[s.name];
    if (series.count == 0) {
        series.min_ms = series.max_ms = s.ms;
    } else {
        series.min_ms = std::min(series.min_ms, s.ms);
        series.max_ms = std::max(series.max_ms, s.ms);
    }
    ++series.count;
    series.total_ms += s.ms;
    if (series.recent.size() < window_size) {
        series.recent.push_back(s.ms);
    } else {
        series.recent[series.next] = s.ms;
        series.next = (series.next + 1) % window_size;
    }
}

std::vector<Sample> Accumulator::snapshot() {
    std::scoped_lock lock(mtx_);
    std::vector<Sample> out;
    for (const auto& [name, series] : series_) {
        const size_t n = series.recent.size();
        for (size_t i = 0; i < n; ++i) {
            out.push_back({name, series.recent[(series.next + i) % n]});
        }
    }
    return out;
}

static double percentile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    auto idx = static_cast<size_t>(q * static_cast<double>(sorted.size() - 1));
    return sorted[idx];
}

std::unordered_map<std::string, Accumulator::Stats> Accumulator::aggregate() {
    std::unordered_map<std::string, Series> copy;
    {
        std::scoped_lock lock(mtx_);
        copy = series_;
    }

    std::unordered_map<std::string, Stats> out;
    out.reserve(copy.size());
    for (auto& [name, series] : copy) {
        std::sort(series.recent.begin(), series.recent.end());
        Stats st;
        st.count = series.count;
        st.total_ms = series.total_ms;
        st.min_ms = series.min_ms;
        st.max_ms = series.max_ms;
        st.avg_ms = series.total_ms / static_cast<double>(series.count);
        st.p50_ms = percentile(series.recent, 0.50);
        st.p95_ms = percentile(series.recent, 0.95);
        out.emplace(name, st);
    }
    return out;
}

void Accumulator::report() {
    for (const auto& [name, st] : aggregate()) {
        char line[256];
        std::snprintf(line, sizeof(line), "%s: n=%zu avg=%.3fms p50=%.3fms p95=%.3fms max=%.3fms",
                      name.c_str(), st.count, st.avg_ms, st.p50_ms, st.p95_ms, st.max_ms);
        tg::log::info(line);
    }
}

void Accumulator::clear() {
    std::scoped_lock lock(mtx_);
    series_.clear();
}

ScopedTimer::~ScopedTimer() {
    auto end = Clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start_).count();
    Accumulator::instance().add({name_, ms});
}

} // namespace tg::prof
