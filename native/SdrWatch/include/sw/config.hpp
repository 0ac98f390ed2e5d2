#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sw {

enum class CfarMode   { Off, OrderStatistic };
enum class CenterMode { Peak, Midpoint };

// Tarama döngüsü politikaları (birbirini dışlar)
struct SingleCycle {};
struct LoopCycles {};
struct RepeatCycles   { int count = 1; };
struct DurationCycles { double seconds = 0.0; };

using CyclePolicy = std::variant<SingleCycle, LoopCycles, RepeatCycles, DurationCycles>;

// CLI'dan gelen ham döngü bayrakları; make_cycle_policy() ile doğrulanır
struct CycleFlags {
    bool                       loop = false;
    std::optional<int>         repeat;
    std::optional<std::string> duration;
};

struct SimTone {
    double freq_hz = 0.0;
    double amp     = 0.0;   // lineer genlik (tam ölçek = 1.0)
};

struct Params {
    // Tarama aralığı
    double start_hz                 = 0.0;
    double stop_hz                  = 0.0;
    double step_hz                  = 2.4e6;

    // Örnekleme / PSD
    double samp_rate                = 2.4e6;
    int    fft_size                 = 4096;
    int    avg                      = 8;
    std::optional<double> gain_db;              // nullopt -> auto

    // Tespit
    double threshold_db             = 8.0;
    int    guard_bins               = 1;
    int    min_width_bins           = 2;
    CenterMode center_mode          = CenterMode::Peak;

    // CFAR
    CfarMode cfar_mode              = CfarMode::OrderStatistic;
    int    cfar_train               = 24;
    int    cfar_guard               = 4;
    double cfar_quantile            = 0.75;
    std::optional<double> cfar_alpha_db;        // nullopt -> threshold_db

    // Baseline
    double ema_alpha_occ            = 0.05;
    double ema_alpha_pow            = 0.05;
    double new_ema_occ_threshold    = 0.02;

    // Döngü
    CyclePolicy cycle               = SingleCycle{};
    double inter_cycle_sleep_s      = 0.0;

    // Kaynak
    std::string driver              = "pluto";  // pluto | sim
    std::string uri;                            // libiio URI
    double sim_noise_std            = 0.02;
    std::vector<SimTone> sim_tones;
    uint32_t sim_seed               = 12345;

    // Çıkışlar
    std::string db_path             = "sdrwatch.db";
    std::string bandplan_path;
    std::string jsonl_path;
    bool   notify                   = false;
    std::string udp_target;                     // host:port
    int    ctrl_port                = 25000;    // 0 -> kapalı
    bool   verbose                  = false;

    double alpha_db() const { return cfar_alpha_db ? *cfar_alpha_db : threshold_db; }
};

// "300", "45s", "10m", "2h", "1d" -> saniye. Hatalı metinde nullopt.
std::optional<double> parse_duration_s(const std::string& text);

// En fazla bir bayrak seçilebilir; hata durumunda err doldurulur.
std::optional<CyclePolicy> make_cycle_policy(const CycleFlags& f, std::string& err);

// Bir döngüdeki pencere sayısı: start + k*step <= stop olan k'lar.
// Adım start'ı ilerletemiyorsa (step < ulp) 0.
int64_t sweep_window_count(const Params& p);

// Tek döngüde izin verilen en fazla pencere
constexpr int64_t kMaxSweepWindows = 1000000;

// İlk ihlalde false + err. Params kısmen uygulanmaz.
bool validate(const Params& p, std::string& err);

const char* cycle_name(const CyclePolicy& c);

} // namespace sw
