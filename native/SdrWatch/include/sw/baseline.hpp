#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sw {

struct BaselineBin {
    int64_t     bin_hz       = 0;
    double      ema_occ      = 0.0;   // [0,1]
    double      ema_power_db = 0.0;
    std::string last_seen_utc;
    int64_t     total_obs    = 0;
    int64_t     hits         = 0;     // <= total_obs
};

// Bin bazlı kalıcı durum. get: yoksa nullopt; put: false -> depolama hatası
class IBaselineStore {
public:
    virtual ~IBaselineStore() = default;
    virtual bool get_bin(int64_t bin_hz, std::optional<BaselineBin>& out) = 0;
    virtual bool put_bin(const BaselineBin& b) = 0;
};

class MemoryBaselineStore : public IBaselineStore {
public:
    bool get_bin(int64_t bin_hz, std::optional<BaselineBin>& out) override {
        auto it = bins_.find(bin_hz);
        if (it == bins_.end()) out.reset();
        else                   out = it->second;
        return true;
    }
    bool put_bin(const BaselineBin& b) override {
        bins_[b.bin_hz] = b;
        return true;
    }
    size_t size() const { return bins_.size(); }

private:
    std::unordered_map<int64_t, BaselineBin> bins_;
};

struct BaselineConfig {
    double alpha_occ     = 0.05;
    double alpha_pow     = 0.05;
    double new_occ_below = 0.02;   // ema_occ bunun altındaysa "yeni"
};

class BaselineTracker {
public:
    BaselineTracker(IBaselineStore& store, const BaselineConfig& cfg = {})
      : store_(store), cfg_(cfg) {}

    // Tek bin için EMA güncellemesi (saf fonksiyon)
    BaselineBin fold(const std::optional<BaselineBin>& prev, int64_t bin_hz,
                     bool occupied, double power_db, const std::string& now_utc) const;

    // Penceredeki tüm binler; rf_freqs_hz/psd_db/above aynı uzunlukta.
    // false: depolama hatası (pencere geri alınmalı)
    bool observe(const std::vector<double>& rf_freqs_hz,
                 const std::vector<double>& psd_db,
                 const std::vector<uint8_t>& above,
                 const std::string& now_utc);

    // Güncelleme SONRASI okunur: bu pencerenin gözlemi de dahil.
    // Kayıt yoksa "yeni" sayılmaz.
    bool is_new(int64_t bin_hz, bool& verdict);

    const BaselineConfig& config() const { return cfg_; }

private:
    IBaselineStore& store_;
    BaselineConfig  cfg_;
};

} // namespace sw
