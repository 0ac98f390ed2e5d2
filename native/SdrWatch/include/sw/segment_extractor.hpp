#pragma once
#include "sw/config.hpp"
#include <cstdint>
#include <vector>

namespace sw {

struct Segment {
    int64_t f_low_hz    = 0;
    int64_t f_center_hz = 0;
    int64_t f_high_hz   = 0;
    double  peak_db     = 0.0;
    double  noise_db    = 0.0;
    double  snr_db      = 0.0;
    int     first_bin   = 0;
    int     last_bin    = 0;   // dahil
    int     peak_bin    = 0;
    int     center_bin  = 0;   // f_center_hz'in geldiği bin
};

struct SegmentConfig {
    int guard_bins     = 1;   // run içinde tolere edilen ardışık alt-eşik bin
    int min_width_bins = 2;
    CenterMode center  = CenterMode::Peak;
};

class SegmentExtractor {
public:
    explicit SegmentExtractor(const SegmentConfig& cfg = {}) : cfg_(cfg) {}

    // above, psd_db, noise_db, freqs_hz aynı uzunlukta olmalı; değilse boş
    std::vector<Segment> extract(const std::vector<double>& freqs_hz,
                                 const std::vector<double>& psd_db,
                                 const std::vector<uint8_t>& above,
                                 const std::vector<double>& noise_db) const;

private:
    SegmentConfig cfg_;
};

} // namespace sw
