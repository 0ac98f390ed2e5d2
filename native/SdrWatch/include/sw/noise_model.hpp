#pragma once
#include "sw/config.hpp"
#include <cstdint>
#include <vector>

namespace sw {

struct NoiseConfig {
    CfarMode mode       = CfarMode::OrderStatistic;
    double threshold_db = 8.0;    // global taban üstü eşik
    int    train        = 24;     // her yanda eğitim hücresi
    int    guard        = 4;      // CUT etrafında hariç tutulan hücre
    double quantile     = 0.75;   // OS-CFAR order statistic
    double alpha_db     = 8.0;    // CFAR eşik çarpanı (dB)
    bool   verbose      = false;
};

struct NoiseEstimate {
    std::vector<uint8_t> above;     // 1: eşik üstü
    std::vector<double>  noise_db;  // bin başına gürültü referansı
    double floor_db = 0.0;          // global modda tek değer
    bool   adaptive = false;        // false: global robust taban kullanıldı
};

// median + 1.4826*MAD
double robust_noise_floor_db(const std::vector<double>& psd_db);

class NoiseModel {
public:
    explicit NoiseModel(const NoiseConfig& cfg = {}) : cfg_(cfg) {}

    NoiseEstimate estimate(const std::vector<double>& psd_db) const;

    // Tek başına kullanılabilir; CFAR penceresi sığmazsa global tabana düşer
    NoiseEstimate global_floor(const std::vector<double>& psd_db) const;
    NoiseEstimate os_cfar(const std::vector<double>& psd_db) const;

    int window_size() const { return 2*cfg_.train + 2*cfg_.guard + 1; }

private:
    NoiseConfig cfg_;
};

} // namespace sw
