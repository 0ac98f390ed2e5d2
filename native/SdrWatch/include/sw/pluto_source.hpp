// sw/pluto_source.hpp
#pragma once

#include "sw/source.hpp"
#include <string>
#include <vector>
#include <complex>
#include <cstdint>
#include <optional>
#include <mutex>

extern "C" {
#include <iio.h>
}

namespace sw {

struct PlutoConfig {
    std::string uri;                         // "ip:192.168.2.1" | "usb:" | "" (default)
    uint64_t    center_hz   = 100000000ULL;  // ilk LO
    uint64_t    samp_hz     = 2400000ULL;    // 2.4 MS/s
    uint64_t    rfbw_hz     = 2400000ULL;
    int         frame_len   = 4096;          // RX buffer (örnek)
    std::optional<double> rx_gain_db;        // nullopt -> slow_attack AGC
};

class PlutoSource : public ISource {
public:
    explicit PlutoSource(const PlutoConfig& cfg);
    ~PlutoSource() override;

    // Kurulum başarılı mı (context + ayarlar + buffer)
    bool ok() const { return rxbuf_ != nullptr; }

    // ISource
    bool tune(double center_hz) override;
    bool read(size_t n, std::vector<std::complex<float>>& out) override;
    void close() override;
    std::string device() const override;
    std::string driver() const override { return "pluto"; }

private:
    PlutoConfig  cfg_{};
    iio_context* ctx_    = nullptr;
    iio_device*  phy_    = nullptr;   // "ad9361-phy"
    iio_channel* lo_ch_  = nullptr;   // "altvoltage0/1" (RX LO)
    iio_device*  rxdev_  = nullptr;   // "cf-ad9361-lpc" (RX DMA)
    iio_channel* rx_i_   = nullptr;   // "voltage0"
    iio_channel* rx_q_   = nullptr;   // "voltage1"
    iio_buffer*  rxbuf_  = nullptr;

    // refill'den artan örnekler bir sonraki read()'e kalır
    std::vector<std::complex<float>> pending_;

    std::mutex m_;

    bool init_context();
    bool apply_static_config();
    bool alloc_buffer();
    bool refill_into(std::vector<std::complex<float>>& out);

    static bool write_dev_ll (iio_device* dev,  const char* attr, long long val);
    static bool write_chan_ll(iio_channel* ch,  const char* attr, long long val);
    static bool write_chan_str(iio_channel* ch, const char* attr, const char* val);
};

} // namespace sw
