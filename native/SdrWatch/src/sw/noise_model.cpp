#include "sw/noise_model.hpp"
#include "sw/utils.hpp"
#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace sw {

double robust_noise_floor_db(const std::vector<double>& psd_db) {
    if (psd_db.empty()) return std::nan("");
    const double med = median(psd_db);
    std::vector<double> dev(psd_db.size());
    for (size_t i=0; i<psd_db.size(); ++i) dev[i] = std::abs(psd_db[i] - med);
    const double mad = median(dev);
    return med + 1.4826 * mad;
}

NoiseEstimate NoiseModel::estimate(const std::vector<double>& psd_db) const {
    if (cfg_.mode == CfarMode::OrderStatistic) return os_cfar(psd_db);
    return global_floor(psd_db);
}

NoiseEstimate NoiseModel::global_floor(const std::vector<double>& psd_db) const {
    NoiseEstimate ne;
    const size_t N = psd_db.size();
    if (N == 0) return ne;

    ne.floor_db = robust_noise_floor_db(psd_db);
    const double dynamic = ne.floor_db + cfg_.threshold_db;
    ne.above.resize(N);
    ne.noise_db.assign(N, ne.floor_db);
    for (size_t i=0; i<N; ++i) ne.above[i] = psd_db[i] > dynamic ? 1 : 0;
    return ne;
}

NoiseEstimate NoiseModel::os_cfar(const std::vector<double>& psd_db) const {
    const int N = static_cast<int>(psd_db.size());
    const int win = window_size();
    if (N == 0) return {};

    // Pencere sığmıyor ya da eğitim hücresi yok: global taban
    if (cfg_.train < 1 || N < win) {
        if (cfg_.verbose)
            std::printf("[CFAR] window %d > bins %d (train=%d); global floor fallback\n",
                        win, N, cfg_.train);
        return global_floor(psd_db);
    }

    // dB -> lineer; kenarlar: replicate dolgu
    const int pad = cfg_.train + cfg_.guard;
    cv::Mat lin, padded;
    try {
        cv::Mat db(1, N, CV_64F, const_cast<double*>(psd_db.data()));
        cv::exp(db * (std::log(10.0) / 10.0), lin);
        cv::copyMakeBorder(lin, padded, 0, 0, pad, pad, cv::BORDER_REPLICATE);
    } catch (const cv::Exception& e) {
        std::fprintf(stderr, "[CFAR] %s; global floor fallback\n", e.what());
        return global_floor(psd_db);
    }

    const double q = std::min(std::max(cfg_.quantile, 1e-6), 1.0 - 1e-6);
    const double alpha = from_db10(cfg_.alpha_db);
    const int cut_lo = cfg_.train;                    // guard+CUT başlangıcı
    const int cut_hi = cfg_.train + 2*cfg_.guard + 1; // bitiş (hariç)

    NoiseEstimate ne;
    ne.adaptive = true;
    ne.above.resize(N);
    ne.noise_db.resize(N);

    std::vector<double> cells(static_cast<size_t>(2 * cfg_.train));
    const double* l = lin.ptr<double>(0);
    for (int i=0; i<N; ++i) {
        // i. bin için pencere görünümü (kopya yok)
        const cv::Mat view = padded.colRange(i, i + win);
        const double* w = view.ptr<double>(0);
        std::copy(w, w + cut_lo, cells.begin());
        std::copy(w + cut_hi, w + win, cells.begin() + cut_lo);

        const double noise_lin = quantile_inplace(cells, q);
        ne.above[i]    = l[i] > noise_lin * alpha ? 1 : 0;
        ne.noise_db[i] = db10(noise_lin);
    }
    if (cfg_.verbose) {
        const auto hits = std::count(ne.above.begin(), ne.above.end(), 1);
        std::printf("[CFAR] bins=%d win=%d q=%.3f alpha=%.2f dB -> %ld above\n",
                    N, win, q, cfg_.alpha_db, static_cast<long>(hits));
    }
    return ne;
}

} // namespace sw
