#include "sw/psd_estimator.hpp"
#include "sw/utils.hpp"
#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace sw {

PsdEstimator::PsdEstimator(const PsdConfig& cfg) : cfg_(cfg) {
    const int L = std::max(1, cfg_.fft_size);
    cfg_.fft_size = L;
    window_.resize(static_cast<size_t>(L), 1.0);
    if (L > 1) {
        // simetrik Hann (numpy.hanning ile aynı)
        for (int n=0; n<L; ++n)
            window_[n] = 0.5 - 0.5 * std::cos(2.0 * CV_PI * n / (L - 1));
    }
}

std::vector<double> PsdEstimator::baseband_freqs() const {
    const int L = cfg_.fft_size;
    const double df = cfg_.samp_rate / L;
    std::vector<double> f(static_cast<size_t>(L));
    for (int k=0; k<L; ++k) f[k] = (k - L/2) * df;
    return f;
}

Psd PsdEstimator::estimate(const std::vector<std::complex<float>>& samples) const {
    const int L = cfg_.fft_size;
    const int hop = std::max(1, L / 2);
    const double scale = 1.0 / (static_cast<double>(L) * cfg_.samp_rate);

    Psd out;
    out.freqs_hz = baseband_freqs();

    if (samples.empty()) {
        out.psd_db.assign(static_cast<size_t>(L), db10(0.0));
        return out;
    }

    // Segment başlangıçları; tam segment yoksa tek kısmi segment (sıfır dolgulu)
    std::vector<size_t> starts;
    const size_t N = samples.size();
    if (N >= static_cast<size_t>(L)) {
        for (size_t s=0; s + L <= N; s += hop) starts.push_back(s);
    } else {
        starts.push_back(0);
    }

    cv::Mat acc;
    try {
        acc = cv::Mat::zeros(1, L, CV_64F);
        cv::Mat seg(1, L, CV_64FC2);
        cv::Mat spec;
        cv::Mat planes[2];

        for (size_t s : starts) {
            auto* p = seg.ptr<cv::Vec2d>(0);
            for (int n=0; n<L; ++n) {
                const size_t idx = s + static_cast<size_t>(n);
                if (idx < N) {
                    p[n][0] = samples[idx].real() * window_[n];
                    p[n][1] = samples[idx].imag() * window_[n];
                } else {
                    p[n][0] = 0.0;
                    p[n][1] = 0.0;
                }
            }
            cv::dft(seg, spec, cv::DFT_COMPLEX_OUTPUT | cv::DFT_ROWS);
            cv::split(spec, planes);
            acc += planes[0].mul(planes[0]) + planes[1].mul(planes[1]);
        }
        acc *= scale / static_cast<double>(starts.size());
        out.segments = static_cast<int>(starts.size());
    } catch (const cv::Exception& e) {
        // Hesaplanamayan pencere tespit üretmez
        std::fprintf(stderr, "[PSD] cv::dft failed: %s\n", e.what());
        out.psd_db.assign(static_cast<size_t>(L), db10(0.0));
        out.segments = 0;
        return out;
    }

    // fftshift: DC ortaya
    out.psd_db.resize(static_cast<size_t>(L));
    const double* a = acc.ptr<double>(0);
    const int shift = L / 2;
    for (int k=0; k<L; ++k) {
        const int src = (k - shift + L) % L;
        out.psd_db[k] = db10(a[src]);
    }
    return out;
}

} // namespace sw
