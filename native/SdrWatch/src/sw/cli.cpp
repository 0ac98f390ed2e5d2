// sw/cli.cpp
#include "sw/cli.hpp"
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

namespace sw {

bool looks_number(const char* s) {
    if (!s || !*s) return false;
    char* end=nullptr;
    std::strtod(s, &end);
    return end && *end=='\0';
}

void print_help() {
    std::puts(
"Usage: sdrwatch --start <Hz> --stop <Hz> [options]\n"
"\n"
" Sweep:\n"
"       --start <Hz>              first window center (e.g. 88e6)\n"
"       --stop <Hz>               last window center upper bound\n"
"       --step <Hz>               center step per window (default 2.4e6)\n"
"       --samp-rate <Hz>          sample rate (default 2.4e6)\n"
"       --fft <int>               FFT size per segment (default 4096)\n"
"       --avg <int>               averaging factor (default 8)\n"
"       --gain <dB|auto>          RX gain (default auto)\n"
"\n"
" Detection:\n"
"       --threshold-db <dbl>      threshold above noise floor (default 8)\n"
"       --guard-bins <int>        below-threshold bins bridged in a run (default 1)\n"
"       --min-width-bins <int>    minimum run width (default 2)\n"
"       --center peak|midpoint    f_center_hz convention (default peak)\n"
"       --cfar off|os             noise model (default os)\n"
"       --cfar-train <int>        training cells per side (default 24)\n"
"       --cfar-guard <int>        guard cells per side (default 4)\n"
"       --cfar-quantile <dbl>     OS-CFAR quantile (default 0.75)\n"
"       --cfar-alpha-db <dbl>     CFAR scaling (default --threshold-db)\n"
"\n"
" Baseline:\n"
"       --new-ema-occ <dbl>       occupancy EMA below which a signal is NEW (default 0.02)\n"
"       --ema-alpha-occ <dbl>     occupancy EMA alpha (default 0.05)\n"
"       --ema-alpha-pow <dbl>     power EMA alpha (default 0.05)\n"
"\n"
" Cycles (mutually exclusive):\n"
"       --loop                    sweep until STOP\n"
"       --repeat <N>              exactly N sweeps\n"
"       --duration <D>            start sweeps while elapsed < D (300, 10m, 2h, 1d)\n"
"       --sleep-between-sweeps <s> pause between sweeps\n"
"\n"
" Source:\n"
"       --driver pluto|sim        sample source (default pluto)\n"
"       --uri <str>               iio uri (ip:192.168.2.1 | usb:)\n"
"       --sim-noise <dbl>         sim noise std (default 0.02)\n"
"       --sim-tone <Hz:amp>       sim carrier, repeatable\n"
"       --sim-seed <int>          sim RNG seed (default 12345)\n"
"\n"
" Output:\n"
"       --db <path>               SQLite database (default sdrwatch.db)\n"
"       --bandplan <csv>          bandplan CSV (default built-in)\n"
"       --jsonl <path>            append detections as JSON lines\n"
"       --notify                  desktop notification for NEW signals\n"
"       --udp <host:port>         send detections as UDP datagrams\n"
"       --ctrl-port <int>         UDP STOP listener on 127.0.0.1 (default 25000, 0=off)\n"
"   -v, --verbose                 per-window progress\n"
    );
}

bool parse_cli(int argc, const char* const* argv, Params& p, CycleFlags& cf,
               bool& help, std::string& err) {
    help = false;
    for (int i=1; i<argc; ++i) {
        std::string a = argv[i];
        auto need = [&]() -> const char* {
            if (i+1 >= argc) { err = "missing value for " + a; return nullptr; }
            return argv[++i];
        };
        auto num = [&](double& out) -> bool {
            const char* v = need();
            if (!v) return false;
            if (!looks_number(v)) { err = "bad numeric value for " + a + ": " + v; return false; }
            out = std::strtod(v, nullptr);
            return true;
        };
        // Tam sayı ve [lo, hi] içinde olmalı; aralık dışı değer cast edilmez
        auto whole = [&](double lo, double hi, double& out) -> bool {
            if (!num(out)) return false;
            if (!std::isfinite(out) || out != std::floor(out)) { err = a + " expects an integer"; return false; }
            if (out < lo || out > hi) { err = a + " out of range"; return false; }
            return true;
        };
        auto inum = [&](int& out) -> bool {
            double d = 0.0;
            if (!whole(static_cast<double>(std::numeric_limits<int>::min()),
                       static_cast<double>(std::numeric_limits<int>::max()), d)) return false;
            out = static_cast<int>(d);
            return true;
        };
        auto onum = [&](std::optional<double>& out) -> bool {
            double d = 0.0;
            if (!num(d)) return false;
            out = d;
            return true;
        };
        auto str = [&](std::string& out) -> bool {
            const char* v = need();
            if (!v) return false;
            out = v;
            return true;
        };

        bool ok = true;
        if (a=="-h" || a=="--help")           { help = true; return true; }
        else if (a=="--start")                ok = num(p.start_hz);
        else if (a=="--stop")                 ok = num(p.stop_hz);
        else if (a=="--step")                 ok = num(p.step_hz);
        else if (a=="--samp-rate")            ok = num(p.samp_rate);
        else if (a=="--fft")                  ok = inum(p.fft_size);
        else if (a=="--avg")                  ok = inum(p.avg);
        else if (a=="--gain") {
            const char* v = need();
            if (!v) return false;
            if (std::string(v) == "auto") p.gain_db.reset();
            else if (looks_number(v))     p.gain_db = std::strtod(v, nullptr);
            else { err = std::string("bad gain: ") + v; return false; }
        }
        else if (a=="--threshold-db")         ok = num(p.threshold_db);
        else if (a=="--guard-bins")           ok = inum(p.guard_bins);
        else if (a=="--min-width-bins")       ok = inum(p.min_width_bins);
        else if (a=="--center") {
            std::string v;
            if (!str(v)) return false;
            if      (v == "peak")     p.center_mode = CenterMode::Peak;
            else if (v == "midpoint") p.center_mode = CenterMode::Midpoint;
            else { err = "--center must be peak or midpoint"; return false; }
        }
        else if (a=="--cfar") {
            std::string v;
            if (!str(v)) return false;
            if      (v == "off") p.cfar_mode = CfarMode::Off;
            else if (v == "os")  p.cfar_mode = CfarMode::OrderStatistic;
            else { err = "--cfar must be off or os"; return false; }
        }
        else if (a=="--cfar-train")           ok = inum(p.cfar_train);
        else if (a=="--cfar-guard")           ok = inum(p.cfar_guard);
        else if (a=="--cfar-quantile")        ok = num(p.cfar_quantile);
        else if (a=="--cfar-alpha-db")        ok = onum(p.cfar_alpha_db);
        else if (a=="--new-ema-occ")          ok = num(p.new_ema_occ_threshold);
        else if (a=="--ema-alpha-occ")        ok = num(p.ema_alpha_occ);
        else if (a=="--ema-alpha-pow")        ok = num(p.ema_alpha_pow);
        else if (a=="--loop")                 cf.loop = true;
        else if (a=="--repeat")               { int n=0; ok = inum(n); if (ok) cf.repeat = n; }
        else if (a=="--duration")             { std::string d; ok = str(d); if (ok) cf.duration = d; }
        else if (a=="--sleep-between-sweeps") ok = num(p.inter_cycle_sleep_s);
        else if (a=="--driver")               ok = str(p.driver);
        else if (a=="--uri")                  ok = str(p.uri);
        else if (a=="--sim-noise")            ok = num(p.sim_noise_std);
        else if (a=="--sim-tone") {
            std::string v;
            if (!str(v)) return false;
            const auto c = v.find(':');
            if (c == std::string::npos || !looks_number(v.substr(0, c).c_str()) ||
                !looks_number(v.substr(c+1).c_str())) {
                err = "--sim-tone expects <Hz>:<amp>";
                return false;
            }
            p.sim_tones.push_back({ std::strtod(v.substr(0, c).c_str(), nullptr),
                                    std::strtod(v.substr(c+1).c_str(), nullptr) });
        }
        else if (a=="--sim-seed") {
            double d = 0.0;
            ok = whole(0.0, static_cast<double>(std::numeric_limits<uint32_t>::max()), d);
            if (ok) p.sim_seed = static_cast<uint32_t>(d);
        }
        else if (a=="--db")                   ok = str(p.db_path);
        else if (a=="--bandplan")             ok = str(p.bandplan_path);
        else if (a=="--jsonl")                ok = str(p.jsonl_path);
        else if (a=="--notify")               p.notify = true;
        else if (a=="--udp")                  ok = str(p.udp_target);
        else if (a=="--ctrl-port")            ok = inum(p.ctrl_port);
        else if (a=="-v" || a=="--verbose")   p.verbose = true;
        else { err = "unknown option: " + a; return false; }
        if (!ok) return false;
    }
    return true;
}

} // namespace sw
