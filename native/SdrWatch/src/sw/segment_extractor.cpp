#include "sw/segment_extractor.hpp"
#include <cmath>

namespace sw {

std::vector<Segment> SegmentExtractor::extract(const std::vector<double>& freqs_hz,
                                               const std::vector<double>& psd_db,
                                               const std::vector<uint8_t>& above,
                                               const std::vector<double>& noise_db) const {
    std::vector<Segment> segs;
    const int N = static_cast<int>(psd_db.size());
    if (N == 0 || (int)freqs_hz.size() != N || (int)above.size() != N || (int)noise_db.size() != N)
        return segs;

    const int guard = cfg_.guard_bins < 0 ? 0 : cfg_.guard_bins;

    int i = 0;
    while (i < N) {
        if (!above[i]) { ++i; continue; }

        const int first = i;
        int last = i;       // son eşik üstü bin
        int gap  = 0;
        int j = i + 1;
        while (j < N && (above[j] || gap < guard)) {
            if (above[j]) { last = j; gap = 0; }
            else          { ++gap; }
            ++j;
        }

        const int width = last - first + 1;
        if (width >= cfg_.min_width_bins) {
            int peak = first;
            for (int k=first+1; k<=last; ++k)
                if (psd_db[k] > psd_db[peak]) peak = k;

            Segment s;
            s.first_bin  = first;
            s.last_bin   = last;
            s.peak_bin   = peak;
            s.center_bin = (cfg_.center == CenterMode::Peak) ? peak : (first + last + 1) / 2;
            s.peak_db    = psd_db[peak];
            s.noise_db   = noise_db[peak];
            s.snr_db     = s.peak_db - s.noise_db;
            s.f_low_hz    = std::llround(freqs_hz[first]);
            s.f_high_hz   = std::llround(freqs_hz[last]);
            s.f_center_hz = std::llround(freqs_hz[s.center_bin]);
            segs.push_back(s);
        }
        // Kuyruktaki boşluk binleri yeni run başlatamaz (hepsi alt-eşik)
        i = last + 1;
    }
    return segs;
}

} // namespace sw
