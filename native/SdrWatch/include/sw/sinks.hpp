#pragma once
#include "sw/store.hpp"
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sw {

// JSONL kaydı: tek satır, sonda '\n' yok
std::string detection_json(const Detection& d);

// "SdrWatch: New signal" gövdesi
std::string new_signal_text(const Detection& d);

// Tüm sink'ler best-effort: false döner, asla fırlatmaz
class ISink {
public:
    virtual ~ISink() = default;
    virtual const char* name() const = 0;
    virtual bool emit(const Detection& d) = 0;
};

class JsonlSink : public ISink {
public:
    explicit JsonlSink(std::string path) : path_(std::move(path)) {}
    const char* name() const override { return "jsonl"; }
    bool emit(const Detection& d) override;

private:
    std::string path_;
};

// notify-send; sadece is_new kayıtlar. Başlatılan süreçler emit() ve yıkıcıda toplanır.
class DesktopNotifier : public ISink {
public:
    explicit DesktopNotifier(std::string program = "notify-send");
    ~DesktopNotifier() override;

    DesktopNotifier(const DesktopNotifier&) = delete;
    DesktopNotifier& operator=(const DesktopNotifier&) = delete;

    const char* name() const override { return "notify"; }
    bool emit(const Detection& d) override;

    // Biten çocukları bekler (WNOHANG); toplanan sayı
    size_t reap();
    size_t pending_children() const { return children_.size(); }

private:
    std::string program_;
    std::vector<int64_t> children_;   // pid
};

// Her tespit tek UDP datagramı (JSON)
class UdpNotifier : public ISink {
public:
    UdpNotifier(const std::string& ip, uint16_t port);
    ~UdpNotifier() override;

    UdpNotifier(const UdpNotifier&) = delete;
    UdpNotifier& operator=(const UdpNotifier&) = delete;

    bool ok() const { return _ok; }
    const char* name() const override { return "udp"; }
    bool emit(const Detection& d) override;

private:
    bool _ok=false;
#ifdef _WIN32
    using socket_t = uintptr_t;
#else
    using socket_t = int;
#endif
    socket_t _fd=(socket_t)-1;
};

// "host:port" -> parçalar; biçim hatalıysa false
bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

} // namespace sw
