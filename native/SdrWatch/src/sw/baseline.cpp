#include "sw/baseline.hpp"
#include "sw/utils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace sw {

BaselineBin BaselineTracker::fold(const std::optional<BaselineBin>& prev, int64_t bin_hz,
                                  bool occupied, double power_db, const std::string& now_utc) const {
    const double occ = occupied ? 1.0 : 0.0;
    BaselineBin b;
    b.bin_hz        = bin_hz;
    b.last_seen_utc = now_utc;

    if (!prev) {
        b.ema_occ      = occ;
        b.ema_power_db = power_db;
        b.total_obs    = 1;
        b.hits         = occupied ? 1 : 0;
        return b;
    }

    b.ema_occ = (1.0 - cfg_.alpha_occ) * prev->ema_occ + cfg_.alpha_occ * occ;
    b.ema_occ = std::min(1.0, std::max(0.0, b.ema_occ));
    // Bozuk kayıt (NaN/inf) yerine son gözlem
    const double prev_pow = std::isfinite(prev->ema_power_db) ? prev->ema_power_db : power_db;
    b.ema_power_db = (1.0 - cfg_.alpha_pow) * prev_pow + cfg_.alpha_pow * power_db;
    b.total_obs    = prev->total_obs + 1;
    b.hits         = std::min(prev->hits + (occupied ? 1 : 0), b.total_obs);
    return b;
}

bool BaselineTracker::observe(const std::vector<double>& rf_freqs_hz,
                              const std::vector<double>& psd_db,
                              const std::vector<uint8_t>& above,
                              const std::string& now_utc) {
    const size_t N = psd_db.size();
    if (rf_freqs_hz.size() != N || above.size() != N) {
        std::fprintf(stderr, "[BASE] size mismatch (freqs=%zu psd=%zu mask=%zu)\n",
                     rf_freqs_hz.size(), N, above.size());
        return false;
    }

    std::optional<BaselineBin> prev;
    for (size_t i=0; i<N; ++i) {
        const int64_t key = bin_key(rf_freqs_hz[i]);
        if (!store_.get_bin(key, prev)) return false;
        if (!store_.put_bin(fold(prev, key, above[i] != 0, psd_db[i], now_utc))) return false;
    }
    return true;
}

bool BaselineTracker::is_new(int64_t bin_hz, bool& verdict) {
    std::optional<BaselineBin> b;
    if (!store_.get_bin(bin_hz, b)) return false;
    verdict = b && b->ema_occ < cfg_.new_occ_below;
    return true;
}

} // namespace sw
