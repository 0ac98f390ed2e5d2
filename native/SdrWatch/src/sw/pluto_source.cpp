// sw/pluto_source.cpp
#include "sw/pluto_source.hpp"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>

namespace sw {

static void log_err(const char* msg) { std::fprintf(stderr, "[Pluto] %s\n", msg); }

bool PlutoSource::write_dev_ll(iio_device* dev, const char* attr, long long val) {
    if (!dev) return false;
    return iio_device_attr_write_longlong(dev, attr, val) >= 0;
}
bool PlutoSource::write_chan_ll(iio_channel* ch, const char* attr, long long val) {
    if (!ch) return false;
    return iio_channel_attr_write_longlong(ch, attr, val) >= 0;
}
bool PlutoSource::write_chan_str(iio_channel* ch, const char* attr, const char* val) {
    if (!ch) return false;
    return iio_channel_attr_write(ch, attr, val) >= 0;
}

PlutoSource::PlutoSource(const PlutoConfig& cfg) : cfg_(cfg) {
    if (!init_context())        { log_err("Context oluşturulamadı."); close(); return; }
    if (!apply_static_config()) { log_err("Ayarlar uygulanamadı.");  close(); return; }
    if (!alloc_buffer())        { log_err("RX buffer ayrılamadı.");  close(); return; }
}

PlutoSource::~PlutoSource() { close(); }

bool PlutoSource::init_context() {
    ctx_ = cfg_.uri.empty() ? iio_create_default_context()
                            : iio_create_context_from_uri(cfg_.uri.c_str());
    if (!ctx_) { log_err("iio context null"); return false; }

    // refill'in sonsuza dek bloklamaması için
    iio_context_set_timeout(ctx_, 1000); // ms

    const int ndev = iio_context_get_devices_count(ctx_);
    auto find_by_substr = [&](const char* key) -> iio_device* {
        if (auto* d = iio_context_find_device(ctx_, key)) return d;
        for (int i=0; i<ndev; ++i) {
            auto* d = iio_context_get_device(ctx_, i);
            const char* nm = iio_device_get_name(d);
            if (nm && std::strstr(nm, key)) return d;
        }
        return nullptr;
    };

    phy_   = find_by_substr("ad9361-phy");
    rxdev_ = find_by_substr("cf-ad9361-lpc");

    lo_ch_ = phy_ ? iio_device_find_channel(phy_, "altvoltage0", true) : nullptr;
    if (!lo_ch_ && phy_) lo_ch_ = iio_device_find_channel(phy_, "altvoltage1", true);

    if (!phy_ || !rxdev_ || !lo_ch_) {
        log_err("ad9361-phy/altvoltage*/cf-ad9361* bulunamadı.");
        return false;
    }

    rx_i_ = iio_device_find_channel(rxdev_, "voltage0", false);
    rx_q_ = iio_device_find_channel(rxdev_, "voltage1", false);
    if (!rx_i_ || !rx_q_) { log_err("RX dev üzerinde voltage0/voltage1 yok."); return false; }
    iio_channel_enable(rx_i_);
    iio_channel_enable(rx_q_);
    return true;
}

bool PlutoSource::apply_static_config() {
    iio_channel* phy_rx_ch = iio_device_find_channel(phy_, "voltage0", false);

    auto try_set = [&](const char* attr, long long v) -> bool {
        if (phy_rx_ch && write_chan_ll(phy_rx_ch, attr, v)) return true;
        return write_dev_ll(phy_, attr, v);
    };

    if (!try_set("sampling_frequency", static_cast<long long>(cfg_.samp_hz))) {
        log_err("sampling_frequency yazılamadı.");
        return false;
    }
    if (!try_set("rf_bandwidth", static_cast<long long>(cfg_.rfbw_hz))) {
        log_err("rf_bandwidth yazılamadı.");
        return false;
    }
    if (!write_chan_ll(lo_ch_, "frequency", static_cast<long long>(cfg_.center_hz))) {
        log_err("RX LO frequency yazılamadı.");
        return false;
    }

    if (!phy_rx_ch) { log_err("gain channel bulunamadı"); return false; }
    if (cfg_.rx_gain_db) {
        if (!write_chan_str(phy_rx_ch, "gain_control_mode", "manual")) { log_err("gain_control_mode=manual yazılamadı."); return false; }
        if (!write_chan_ll (phy_rx_ch, "hardwaregain", static_cast<long long>(*cfg_.rx_gain_db))) { log_err("hardwaregain yazılamadı."); return false; }
    } else {
        if (!write_chan_str(phy_rx_ch, "gain_control_mode", "slow_attack")) { log_err("gain_control_mode=slow_attack yazılamadı."); return false; }
    }
    return true;
}

bool PlutoSource::alloc_buffer() {
    rxbuf_ = iio_device_create_buffer(rxdev_, static_cast<size_t>(cfg_.frame_len), false);
    if (!rxbuf_) { log_err("iio_device_create_buffer() başarısız."); return false; }
    return true;
}

bool PlutoSource::tune(double center_hz) {
    std::lock_guard<std::mutex> lk(m_);
    if (!lo_ch_ || center_hz <= 0.0) return false;
    if (!write_chan_ll(lo_ch_, "frequency", static_cast<long long>(center_hz))) {
        std::fprintf(stderr, "[Pluto] LO %.0f Hz yazılamadı.\n", center_hz);
        return false;
    }
    cfg_.center_hz = static_cast<uint64_t>(center_hz);
    // Eski LO'dan kalan örnekler artık geçersiz
    pending_.clear();
    return true;
}

bool PlutoSource::refill_into(std::vector<std::complex<float>>& out) {
    const ssize_t nbytes = iio_buffer_refill(rxbuf_);
    if (nbytes <= 0) return false;

    const ptrdiff_t step = iio_buffer_step(rxbuf_);
    auto* p_i   = static_cast<uint8_t*>(iio_buffer_first(rxbuf_, rx_i_));
    auto* p_q   = static_cast<uint8_t*>(iio_buffer_first(rxbuf_, rx_q_));
    auto* p_end = static_cast<uint8_t*>(iio_buffer_end(rxbuf_));
    const float scale = 1.0f / 32768.0f;

    for (; p_i < p_end && p_q < p_end; p_i += step, p_q += step) {
        int16_t i16, q16;
        std::memcpy(&i16, p_i, sizeof(i16));
        std::memcpy(&q16, p_q, sizeof(q16));
        out.emplace_back(i16 * scale, q16 * scale);
    }
    return true;
}

bool PlutoSource::read(size_t n, std::vector<std::complex<float>>& out) {
    std::lock_guard<std::mutex> lk(m_);
    if (!rxbuf_) return false;

    out.clear();
    out.reserve(n);
    const size_t carry = std::min(n, pending_.size());
    out.insert(out.end(), pending_.begin(), pending_.begin() + carry);
    pending_.erase(pending_.begin(), pending_.begin() + carry);

    // Kısa/başarısız refill: kısa bekleme ve tekrar (sınır yok)
    while (out.size() < n) {
        if (!refill_into(out)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
    }
    if (out.size() > n) {
        pending_.assign(out.begin() + n, out.end());
        out.resize(n);
    }
    return true;
}

void PlutoSource::close() {
    std::lock_guard<std::mutex> lk(m_);

    if (rxbuf_) {
        iio_buffer_cancel(rxbuf_);
        iio_buffer_destroy(rxbuf_);
        rxbuf_ = nullptr;
    }
    if (rx_i_) { iio_channel_disable(rx_i_); rx_i_ = nullptr; }
    if (rx_q_) { iio_channel_disable(rx_q_); rx_q_ = nullptr; }
    rxdev_ = nullptr;
    phy_   = nullptr;
    lo_ch_ = nullptr;
    pending_.clear();

    if (ctx_) {
        iio_context_destroy(ctx_);
        ctx_ = nullptr;
    }
}

std::string PlutoSource::device() const {
    return cfg_.uri.empty() ? std::string("PlutoSDR (default)") : "PlutoSDR " + cfg_.uri;
}

} // namespace sw
