#pragma once
#include <vector>
#include <algorithm>
#include <cmath>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace sw {

// Basit persentil (0..100), lineer interpolasyon
inline double percentile(std::vector<double> v, double p) {
    if (v.empty()) return std::nan("");
    std::sort(v.begin(), v.end());
    if (p <= 0) return v.front();
    if (p >= 100) return v.back();
    const double pos = (p/100.0) * (v.size()-1);
    const auto idx = static_cast<size_t>(std::floor(pos));
    const double frac = pos - idx;
    if (idx+1 < v.size()) return v[idx] + frac * (v[idx+1] - v[idx]);
    return v[idx];
}

// Kuantil (0..1), yerinde; sadece nth_element ile kısmi sıralama yapar.
// v'nin sırası bozulur.
inline double quantile_inplace(std::vector<double>& v, double q) {
    if (v.empty()) return std::nan("");
    if (q <= 0) return *std::min_element(v.begin(), v.end());
    if (q >= 1) return *std::max_element(v.begin(), v.end());
    const double pos = q * (v.size()-1);
    const auto idx = static_cast<size_t>(std::floor(pos));
    const double frac = pos - idx;
    std::nth_element(v.begin(), v.begin() + idx, v.end());
    const double lo = v[idx];
    if (frac == 0.0 || idx+1 >= v.size()) return lo;
    const double hi = *std::min_element(v.begin() + idx + 1, v.end());
    return lo + frac * (hi - lo);
}

inline double median(const std::vector<double>& v) { return percentile(v, 50.0); }

// 10*log10, log(0) korumalı
inline double db10(double lin) { return 10.0 * std::log10(std::max(lin, 1e-20)); }
inline double from_db10(double db) { return std::pow(10.0, db / 10.0); }

// RF frekansından baseline anahtarı (tam sayı Hz)
inline int64_t bin_key(double hz) { return static_cast<int64_t>(std::llround(hz)); }

// ISO-8601 UTC, mikrosaniye: 2026-10-19T12:00:00.123456+00:00
inline std::string utc_now_iso() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto us  = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<long long>(us));
    return buf;
}

struct TicToc {
    using clock = std::chrono::steady_clock;
    clock::time_point t0;
    void tic() { t0 = clock::now(); }
    double toc_ms() const {
        using namespace std::chrono;
        return duration_cast<duration<double, std::milli>>(clock::now() - t0).count();
    }
};

} // namespace sw
