#pragma once
#include <vector>
#include <complex>

namespace sw {

struct PsdConfig {
    double samp_rate  = 2.4e6;
    int    fft_size   = 4096;
    int    avg        = 8;
    double floor_watt = 1e-20;   // log(0) koruması
};

struct Psd {
    std::vector<double> freqs_hz;   // baseband, artan, 0 merkezli
    std::vector<double> psd_db;
    int segments = 0;               // ortalamaya giren segment sayısı
};

// Welch tarzı: %50 örtüşen Hann pencereli segmentler, |X|^2/(L*fs), ortalama, fftshift
class PsdEstimator {
public:
    explicit PsdEstimator(const PsdConfig& cfg = {});

    Psd estimate(const std::vector<std::complex<float>>& samples) const;

    // Aynı frekans ekseni, örnek olmadan
    std::vector<double> baseband_freqs() const;

private:
    PsdConfig cfg_;
    std::vector<double> window_;
};

} // namespace sw
