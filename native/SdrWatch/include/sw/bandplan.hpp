#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace sw {

struct Band {
    int64_t     low_hz  = 0;
    int64_t     high_hz = 0;
    std::string service;
    std::string region;
    std::string notes;
};

struct BandLabel {
    std::string service;
    std::string region;
    std::string notes;
};

// Statik, sıralı tablo; ilk eşleşen kazanır
class Bandplan {
public:
    Bandplan();   // yerleşik varsayılan tablo

    // CSV: low_hz,high_hz,service,region,notes (f_low_hz/f_high_hz da kabul).
    // Bozuk satırlar atlanır. Dosya açılamazsa false ve tablo değişmez.
    bool load_csv(const std::string& path);
    bool load_csv_text(const std::string& text);

    BandLabel lookup(int64_t f_hz) const;

    const std::vector<Band>& bands() const { return bands_; }
    int skipped_rows() const { return skipped_; }

    static std::vector<Band> builtin();

private:
    std::vector<Band> bands_;
    int skipped_ = 0;
};

// Tırnak destekli tek CSV satırı ayrıştırıcı
std::vector<std::string> split_csv_line(const std::string& line);

} // namespace sw
