#include "sw/sweep_controller.hpp"
#include "sw/utils.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <thread>

namespace sw {

const char* outcome_name(SweepOutcome o) {
    switch (o) {
        case SweepOutcome::Completed:     return "completed";
        case SweepOutcome::Cancelled:     return "cancelled";
        case SweepOutcome::SourceFailed:  return "source failed";
        case SweepOutcome::StorageFailed: return "storage failed";
    }
    return "?";
}

SweepController::SweepController(ISource& src, IStore& store, const Bandplan& bandplan,
                                 const Params& p, std::atomic<bool>& stop)
    : src_(src), store_(store), bandplan_(bandplan), p_(p), stop_(stop),
      psd_({ p.samp_rate, p.fft_size, p.avg }),
      noise_({ p.cfar_mode, p.threshold_db, p.cfar_train, p.cfar_guard,
               p.cfar_quantile, p.alpha_db(), p.verbose }),
      extractor_({ p.guard_bins, p.min_width_bins, p.center_mode }),
      tracker_(store, { p.ema_alpha_occ, p.ema_alpha_pow, p.new_ema_occ_threshold }) {}

double SweepController::window_center(int64_t k) const {
    // Biriken toplama hatası yerine indeksle hesapla
    return p_.start_hz + static_cast<double>(k) * p_.step_hz;
}

std::vector<double> SweepController::window_centers() const {
    std::vector<double> c;
    const int64_t n = sweep_window_count(p_);
    if (n > kMaxSweepWindows) return c;
    c.reserve(static_cast<size_t>(n));
    for (int64_t k=0; k<n; ++k) c.push_back(window_center(k));
    return c;
}

SweepOutcome SweepController::process_window(int64_t scan_id, double center_hz, WindowReport& rep) {
    TicToc t;
    t.tic();
    rep = WindowReport{};
    rep.center_hz = center_hz;

    // 1) Donanım
    if (!src_.tune(center_hz)) {
        std::fprintf(stderr, "[SWEEP] tune %.0f Hz failed\n", center_hz);
        return SweepOutcome::SourceFailed;
    }
    const size_t L = static_cast<size_t>(p_.fft_size);
    // Tuner/AGC otursun diye ilk buffer atılır
    if (!src_.read(L, buf_) ||
        !src_.read(L * static_cast<size_t>(p_.avg), buf_)) {
        std::fprintf(stderr, "[SWEEP] read at %.0f Hz failed\n", center_hz);
        return SweepOutcome::SourceFailed;
    }

    // 2) Hesap
    Psd psd = psd_.estimate(buf_);
    for (double& f : psd.freqs_hz) f += center_hz;   // baseband -> RF
    const NoiseEstimate ne = noise_.estimate(psd.psd_db);
    const auto segs = extractor_.extract(psd.freqs_hz, psd.psd_db, ne.above, ne.noise_db);

    rep.bins       = static_cast<int>(psd.psd_db.size());
    rep.above_bins = static_cast<int>(std::count(ne.above.begin(), ne.above.end(), 1));
    rep.segments   = static_cast<int>(segs.size());
    rep.adaptive   = ne.adaptive;

    // 3) Kayıt: pencere başına tek transaction
    const std::string now = utc_now_iso();
    if (!store_.begin_window()) return SweepOutcome::StorageFailed;

    if (!tracker_.observe(psd.freqs_hz, psd.psd_db, ne.above, now)) {
        store_.rollback_window();
        return SweepOutcome::StorageFailed;
    }

    std::vector<Detection> dets;
    dets.reserve(segs.size());
    for (const auto& s : segs) {
        Detection d;
        d.scan_id  = scan_id;
        d.time_utc = now;
        d.seg      = s;
        d.label    = bandplan_.lookup(s.f_center_hz);
        if (!store_.add_detection(d) || !tracker_.is_new(s.f_center_hz, d.is_new)) {
            store_.rollback_window();
            return SweepOutcome::StorageFailed;
        }
        if (d.is_new) ++rep.new_signals;
        dets.push_back(std::move(d));
    }

    if (!store_.commit_window()) {
        store_.rollback_window();
        return SweepOutcome::StorageFailed;
    }
    ++windows_;
    detections_ += static_cast<int64_t>(dets.size());

    // 4) Sink'ler: commit sonrası, hatalar yutulur
    emit_to_sinks(dets);

    rep.elapsed_ms = t.toc_ms();
    if (p_.verbose) {
        std::printf("[SWEEP] %.3f MHz  bins=%d above=%d segs=%d new=%d  %s  %.1f ms\n",
                    center_hz / 1e6, rep.bins, rep.above_bins, rep.segments,
                    rep.new_signals, rep.adaptive ? "cfar" : "floor", rep.elapsed_ms);
    }
    return SweepOutcome::Completed;
}

void SweepController::emit_to_sinks(const std::vector<Detection>& dets) {
    for (const auto& d : dets) {
        if (d.is_new) {
            std::printf("[NEW] %.6f MHz  SNR %.1f dB  %s %s\n",
                        d.seg.f_center_hz / 1e6, d.seg.snr_db,
                        d.label.service.empty() ? "Unknown" : d.label.service.c_str(),
                        d.label.region.c_str());
        }
        for (ISink* s : sinks_) {
            if (!s->emit(d))
                std::fprintf(stderr, "[SINK] %s emit failed; continuing\n", s->name());
        }
    }
}

SweepOutcome SweepController::run_cycle() {
    state_ = SweepState::Sweeping;

    ScanMeta m;
    m.t_start_utc = utc_now_iso();
    m.f_start_hz  = p_.start_hz;
    m.f_stop_hz   = p_.stop_hz;
    m.step_hz     = p_.step_hz;
    m.samp_rate   = p_.samp_rate;
    m.fft_size    = p_.fft_size;
    m.avg         = p_.avg;
    m.device      = src_.device();
    m.driver      = src_.driver();

    const auto scan_id = store_.start_scan(m);
    if (!scan_id) {
        state_ = SweepState::Idle;
        return SweepOutcome::StorageFailed;
    }
    last_scan_id_ = *scan_id;

    const int64_t n = sweep_window_count(p_);
    std::printf("[SWEEP] scan %lld: %.3f..%.3f MHz, %lld windows\n",
                static_cast<long long>(*scan_id), p_.start_hz / 1e6, p_.stop_hz / 1e6,
                static_cast<long long>(n));

    SweepOutcome out = SweepOutcome::Completed;
    int64_t dets_before = detections_;
    WindowReport rep;
    for (int64_t k=0; k<n; ++k) {
        if (stop_requested()) { out = SweepOutcome::Cancelled; break; }
        out = process_window(*scan_id, window_center(k), rep);
        if (out != SweepOutcome::Completed) break;
    }

    // Finalizing: t_end_utc her durumda tam bir kez
    state_ = SweepState::Finalizing;
    if (!store_.end_scan(*scan_id, utc_now_iso()) && out == SweepOutcome::Completed)
        out = SweepOutcome::StorageFailed;
    state_ = SweepState::Idle;

    std::printf("[SWEEP] scan %lld %s (%lld detections)\n",
                static_cast<long long>(*scan_id), outcome_name(out),
                static_cast<long long>(detections_ - dets_before));
    return out;
}

void SweepController::sleep_between_cycles() const {
    using clock = std::chrono::steady_clock;
    const auto until = clock::now() + std::chrono::duration_cast<clock::duration>(
                           std::chrono::duration<double>(p_.inter_cycle_sleep_s));
    while (!stop_requested()) {
        const auto now = clock::now();
        if (now >= until) break;
        std::this_thread::sleep_for(std::min<clock::duration>(until - now, std::chrono::milliseconds(100)));
    }
}

SweepOutcome SweepController::run() {
    using clock = std::chrono::steady_clock;
    const auto t0 = clock::now();
    auto elapsed_s = [&] { return std::chrono::duration<double>(clock::now() - t0).count(); };

    const auto* dur = std::get_if<DurationCycles>(&p_.cycle);
    const auto* rep = std::get_if<RepeatCycles>(&p_.cycle);
    const bool  single = std::holds_alternative<SingleCycle>(p_.cycle);

    std::printf("[SWEEP] cycle mode: %s\n", cycle_name(p_.cycle));
    for (;;) {
        if (stop_requested()) return SweepOutcome::Cancelled;
        if (dur && elapsed_s() >= dur->seconds) break;

        const SweepOutcome o = run_cycle();
        if (o != SweepOutcome::Completed) return o;
        ++cycles_;

        // Başlamış döngü her zaman biter; süre sonra kontrol edilir
        if (dur && elapsed_s() >= dur->seconds) break;
        if (single) break;
        if (rep && cycles_ >= rep->count) break;

        if (p_.inter_cycle_sleep_s > 0.0) sleep_between_cycles();
    }
    return SweepOutcome::Completed;
}

} // namespace sw
