#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>

namespace sw {

// Datagram bir STOP komutu mu: büyük/küçük harf duyarsız "STOP", "EXIT" veya "QUIT" içerir
bool is_stop_command(const char* data, size_t n);

// UDP kontrol dinleyici: 127.0.0.1:<port> 'STOP'|'EXIT'|'QUIT' -> stop_flag=true
class CtrlServer {
public:
    explicit CtrlServer(std::atomic<bool>& stop_flag, uint16_t port = 25000);
    ~CtrlServer();

    CtrlServer(const CtrlServer&) = delete;
    CtrlServer& operator=(const CtrlServer&) = delete;

    // port 0: işletim sistemi boş bir port seçer, port() ile okunur
    bool start();
    void stop();

    uint16_t port() const { return port_; }

private:
    void loop();

#ifdef _WIN32
    using socket_t = uintptr_t;
#else
    using socket_t = int;
#endif

    std::atomic<bool>& stop_;
    std::atomic<bool>  quit_{false};
    uint16_t port_;
    bool     open_ = false;
    socket_t sock_ = (socket_t)-1;
    std::thread th_;
};

} // namespace sw
