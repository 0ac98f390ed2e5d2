#pragma once
#include "sw/baseline.hpp"
#include "sw/bandplan.hpp"
#include "sw/segment_extractor.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace sw {

struct ScanMeta {
    std::string t_start_utc;
    double  f_start_hz = 0.0;
    double  f_stop_hz  = 0.0;
    double  step_hz    = 0.0;
    double  samp_rate  = 0.0;
    int     fft_size   = 0;
    int     avg        = 0;
    std::string device;
    std::string driver;
};

struct Detection {
    int64_t     scan_id = 0;
    std::string time_utc;
    Segment     seg;
    BandLabel   label;
    bool        is_new = false;   // sadece sink'ler için; tabloya yazılmaz
};

// Kalıcı depo. Tüm fonksiyonlar false/nullopt ile hata bildirir.
class IStore : public IBaselineStore {
public:
    virtual std::optional<int64_t> start_scan(const ScanMeta& m) = 0;
    // t_end_utc yalnızca NULL ise yazılır
    virtual bool end_scan(int64_t scan_id, const std::string& t_end_utc) = 0;

    // Pencere başına tek transaction
    virtual bool begin_window() = 0;
    virtual bool commit_window() = 0;
    virtual void rollback_window() = 0;

    virtual bool add_detection(const Detection& d) = 0;
};

} // namespace sw
