#pragma once
#include "sw/source.hpp"
#include "sw/config.hpp"
#include <chrono>
#include <cmath>
#include <random>
#include <thread>
#include <vector>

namespace sw {

// Gaussian gürültü + sabit taşıyıcılar (RF frekansında) simülasyonu
class SimSource : public ISource {
public:
    SimSource(double samp_rate, double noise_std, std::vector<SimTone> tones = {},
              uint32_t seed = 12345, int read_delay_ms = 0)
      : fs_(samp_rate), noise_(0.0, noise_std), tones_(std::move(tones)),
        phase_(tones_.size(), 0.0), rng_(seed), delay_ms_(read_delay_ms) {}

    bool tune(double center_hz) override {
        if (closed_) return false;
        center_ = center_hz;
        ++tunes_;
        return true;
    }

    bool read(size_t n, std::vector<std::complex<float>>& out) override {
        if (closed_) return false;
        if (delay_ms_ > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));

        out.resize(n);
        for (size_t i=0; i<n; ++i) {
            out[i] = { (float)noise_(rng_), (float)noise_(rng_) };
        }

        // Geçiş bandındaki taşıyıcıları ekle; faz okumalar arası sürer
        const double two_pi = 6.283185307179586;
        for (size_t k=0; k<tones_.size(); ++k) {
            const double off = tones_[k].freq_hz - center_;
            if (std::abs(off) >= fs_ / 2.0) continue;
            const double dphi = two_pi * off / fs_;
            double ph = phase_[k];
            for (size_t i=0; i<n; ++i) {
                out[i] += std::complex<float>((float)(tones_[k].amp * std::cos(ph)),
                                              (float)(tones_[k].amp * std::sin(ph)));
                ph = std::fmod(ph + dphi, two_pi);
            }
            phase_[k] = ph;
        }
        samples_read_ += n;
        return true;
    }

    void close() override { closed_ = true; }

    std::string device() const override { return "simulated"; }
    std::string driver() const override { return "sim"; }

    double center_hz()   const { return center_; }
    size_t tune_count()  const { return tunes_; }
    size_t samples_read() const { return samples_read_; }
    bool   closed()      const { return closed_; }

private:
    double fs_;
    std::normal_distribution<double> noise_;
    std::vector<SimTone> tones_;
    std::vector<double>  phase_;
    std::mt19937 rng_;
    int    delay_ms_;
    double center_ = 0.0;
    size_t tunes_ = 0;
    size_t samples_read_ = 0;
    bool   closed_ = false;
};

} // namespace sw
