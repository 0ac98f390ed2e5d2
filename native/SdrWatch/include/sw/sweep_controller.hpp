#pragma once
#include "sw/source.hpp"
#include "sw/config.hpp"
#include "sw/psd_estimator.hpp"
#include "sw/noise_model.hpp"
#include "sw/segment_extractor.hpp"
#include "sw/baseline.hpp"
#include "sw/bandplan.hpp"
#include "sw/store.hpp"
#include "sw/sinks.hpp"
#include <atomic>
#include <cstdint>
#include <vector>

namespace sw {

enum class SweepOutcome {
    Completed,       // politika bitti
    Cancelled,       // dış STOP/SIGINT (pencere/döngü arasında görüldü)
    SourceFailed,    // tune/read hatası
    StorageFailed    // yazma hatası; pencere geri alındı
};

enum class SweepState { Idle, Sweeping, Finalizing };

struct WindowReport {
    double center_hz   = 0.0;
    int    bins        = 0;
    int    above_bins  = 0;
    int    segments    = 0;
    int    new_signals = 0;
    bool   adaptive    = false;   // CFAR mi global taban mi
    double elapsed_ms  = 0.0;
};

const char* outcome_name(SweepOutcome o);

class SweepController {
public:
    // store ve src ömür boyu dışarıdan sahiplenilir
    SweepController(ISource& src, IStore& store, const Bandplan& bandplan,
                    const Params& p, std::atomic<bool>& stop);

    // Sahiplik yok; best-effort
    void add_sink(ISink* sink) { sinks_.push_back(sink); }

    // Döngü politikasına göre tüm ScanRun'lar
    SweepOutcome run();

    // Tek ScanRun: [start, stop] boyunca tüm pencereler
    SweepOutcome run_cycle();

    // Tek pencere: tune -> read -> PSD -> gürültü -> segment -> bandplan -> baseline -> kayıt -> sink
    SweepOutcome process_window(int64_t scan_id, double center_hz, WindowReport& rep);

    // k. pencere merkezi (Hz)
    double window_center(int64_t k) const;
    // Teşhis için; pencere sınırı aşılırsa boş
    std::vector<double> window_centers() const;

    SweepState state()           const { return state_; }
    int     cycles_completed()   const { return cycles_; }
    int64_t last_scan_id()       const { return last_scan_id_; }
    int64_t windows_processed()  const { return windows_; }
    int64_t detections_total()   const { return detections_; }

private:
    bool stop_requested() const { return stop_.load(std::memory_order_acquire); }
    void sleep_between_cycles() const;
    void emit_to_sinks(const std::vector<Detection>& dets);

    ISource&          src_;
    IStore&           store_;
    const Bandplan&   bandplan_;
    Params            p_;
    std::atomic<bool>& stop_;

    PsdEstimator      psd_;
    NoiseModel        noise_;
    SegmentExtractor  extractor_;
    BaselineTracker   tracker_;
    std::vector<ISink*> sinks_;

    std::vector<std::complex<float>> buf_;
    SweepState state_   = SweepState::Idle;
    int     cycles_     = 0;
    int64_t last_scan_id_ = 0;
    int64_t windows_    = 0;
    int64_t detections_ = 0;
};

} // namespace sw
