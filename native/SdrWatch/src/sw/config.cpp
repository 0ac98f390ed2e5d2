// sw/config.cpp
#include "sw/config.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace sw {

std::optional<double> parse_duration_s(const std::string& text) {
    std::string t;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c)))
            t.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (t.empty()) return std::nullopt;

    double mult = 1.0;
    switch (t.back()) {
        case 's': t.pop_back(); break;
        case 'm': mult = 60.0;    t.pop_back(); break;
        case 'h': mult = 3600.0;  t.pop_back(); break;
        case 'd': mult = 86400.0; t.pop_back(); break;
        default: break;
    }
    if (t.empty()) return std::nullopt;

    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (!end || *end != '\0' || !std::isfinite(v) || v < 0.0) return std::nullopt;
    return v * mult;
}

std::optional<CyclePolicy> make_cycle_policy(const CycleFlags& f, std::string& err) {
    const int chosen = (f.loop ? 1 : 0) + (f.repeat ? 1 : 0) + (f.duration ? 1 : 0);
    if (chosen > 1) {
        err = "--loop, --repeat and --duration are mutually exclusive";
        return std::nullopt;
    }
    if (f.loop) return CyclePolicy{LoopCycles{}};
    if (f.repeat) {
        if (*f.repeat < 1) { err = "--repeat must be >= 1"; return std::nullopt; }
        return CyclePolicy{RepeatCycles{*f.repeat}};
    }
    if (f.duration) {
        auto s = parse_duration_s(*f.duration);
        if (!s) { err = "invalid duration string: " + *f.duration; return std::nullopt; }
        return CyclePolicy{DurationCycles{*s}};
    }
    return CyclePolicy{SingleCycle{}};
}

int64_t sweep_window_count(const Params& p) {
    if (!std::isfinite(p.start_hz) || !std::isfinite(p.stop_hz) || !(p.step_hz > 0.0)) return 0;
    if (p.stop_hz < p.start_hz) return 0;
    if (p.start_hz + p.step_hz == p.start_hz) return p.stop_hz == p.start_hz ? 1 : 0;

    const double span = (p.stop_hz - p.start_hz) / p.step_hz;
    if (!(span < 1e15)) return std::numeric_limits<int64_t>::max();

    int64_t n = static_cast<int64_t>(std::floor(span)) + 1;
    // Bölmedeki yuvarlama: merkezler start + k*step ile aynı şekilde hesaplanır
    while (n > 1 && p.start_hz + static_cast<double>(n - 1) * p.step_hz > p.stop_hz) --n;
    while (p.start_hz + static_cast<double>(n) * p.step_hz <= p.stop_hz) ++n;
    return n;
}

bool validate(const Params& p, std::string& err) {
    auto fail = [&](const char* m) { err = m; return false; };

    if (!std::isfinite(p.start_hz) || !std::isfinite(p.stop_hz)) return fail("--start/--stop must be finite");
    if (p.start_hz <= 0.0)                  return fail("--start must be > 0");
    if (p.stop_hz < p.start_hz)             return fail("--stop must be >= --start");
    if (!(p.step_hz > 0.0))                 return fail("--step must be > 0");
    const int64_t windows = sweep_window_count(p);
    if (windows < 1)                        return fail("--step is too small to advance from --start");
    if (windows > kMaxSweepWindows)         return fail("too many windows per sweep; raise --step or narrow --start/--stop");
    if (!(p.samp_rate > 0.0))               return fail("--samp-rate must be > 0");
    if (p.fft_size < 8)                     return fail("--fft must be >= 8");
    if (p.avg < 1)                          return fail("--avg must be >= 1");
    if (!std::isfinite(p.threshold_db) || p.threshold_db < 0.0)
                                            return fail("--threshold-db must be >= 0");
    if (p.guard_bins < 0)                   return fail("--guard-bins must be >= 0");
    if (p.min_width_bins < 1)               return fail("--min-width-bins must be >= 1");
    if (p.cfar_train < 0 || p.cfar_guard < 0)
                                            return fail("--cfar-train/--cfar-guard must be >= 0");
    if (!(p.cfar_quantile > 0.0 && p.cfar_quantile < 1.0))
                                            return fail("--cfar-quantile must be in (0,1)");
    if (p.cfar_alpha_db && !std::isfinite(*p.cfar_alpha_db))
                                            return fail("--cfar-alpha-db must be finite");
    if (!(p.ema_alpha_occ > 0.0 && p.ema_alpha_occ <= 1.0) ||
        !(p.ema_alpha_pow > 0.0 && p.ema_alpha_pow <= 1.0))
                                            return fail("EMA alphas must be in (0,1]");
    if (!(p.new_ema_occ_threshold >= 0.0 && p.new_ema_occ_threshold <= 1.0))
                                            return fail("--new-ema-occ must be in [0,1]");
    if (!(p.inter_cycle_sleep_s >= 0.0))    return fail("--sleep-between-sweeps must be >= 0");
    if (p.driver != "pluto" && p.driver != "sim")
                                            return fail("--driver must be pluto or sim");
    if (p.db_path.empty())                  return fail("--db must not be empty");
    if (p.ctrl_port < 0 || p.ctrl_port > 65535)
                                            return fail("--ctrl-port must be in 0..65535");
    if (!(p.sim_noise_std >= 0.0))          return fail("--sim-noise must be >= 0");
    if (const auto* r = std::get_if<RepeatCycles>(&p.cycle); r && r->count < 1)
                                            return fail("--repeat must be >= 1");
    if (const auto* d = std::get_if<DurationCycles>(&p.cycle); d && !(d->seconds >= 0.0))
                                            return fail("--duration must be >= 0");
    return true;
}

const char* cycle_name(const CyclePolicy& c) {
    switch (c.index()) {
        case 0:  return "single";
        case 1:  return "loop";
        case 2:  return "repeat";
        default: return "duration";
    }
}

} // namespace sw
