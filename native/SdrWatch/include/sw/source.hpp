#pragma once
#include <vector>
#include <complex>
#include <cstddef>
#include <string>

namespace sw {

// Örnek sağlayıcı arayüzü (Pluto/simülasyon hepsi buradan türesin)
class ISource {
public:
    virtual ~ISource() = default;

    // RX LO'yu center_hz'e ayarla. false: donanım hatası
    virtual bool tune(double center_hz) = 0;

    // Tam n örnek doldurur; kısa okumaları kendi içinde tekrarlar.
    // false: kaynak kapalı/hata
    virtual bool read(size_t n, std::vector<std::complex<float>>& out) = 0;

    // Idempotent
    virtual void close() {}

    // scans.device / scans.driver kolonları için
    virtual std::string device() const = 0;
    virtual std::string driver() const = 0;
};

} // namespace sw
