// sw/ctrl_server.cpp
#include "sw/ctrl_server.hpp"
#include "sw/net.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <string>

namespace sw {

bool is_stop_command(const char* data, size_t n) {
    std::string s(data, n);
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s.find("STOP") != std::string::npos ||
           s.find("EXIT") != std::string::npos ||
           s.find("QUIT") != std::string::npos;
}

CtrlServer::CtrlServer(std::atomic<bool>& stop_flag, uint16_t port)
    : stop_(stop_flag), port_(port) {}

CtrlServer::~CtrlServer() { stop(); }

bool CtrlServer::start() {
    if (open_) return true;
    const net::sock_t s = net::udp_socket();
    if (s == net::kBadSock) return false;

    sockaddr_in sa{};
    net::ipv4_addr("127.0.0.1", port_, sa);
    if (::bind(s, (sockaddr*)&sa, sizeof(sa)) != 0) {
        net::closesock(s);
        return false;
    }
    // port 0 ise atanan portu oku
    net::socklen_t len = sizeof(sa);
    if (::getsockname(s, (sockaddr*)&sa, &len) == 0) port_ = ntohs(sa.sin_port);

    net::set_nonblock(s);
    sock_ = (socket_t)s;
    open_ = true;
    quit_.store(false, std::memory_order_release);
    th_ = std::thread([this]{ loop(); });
    return true;
}

void CtrlServer::stop() {
    quit_.store(true, std::memory_order_release);
    if (th_.joinable()) th_.join();
    if (open_) { net::closesock((net::sock_t)sock_); open_ = false; }
}

void CtrlServer::loop() {
    char buf[256];
    while (!quit_.load(std::memory_order_acquire) && !stop_.load(std::memory_order_acquire)) {
        sockaddr_in from{};
        net::socklen_t flen = sizeof(from);
        const int n = (int)::recvfrom((net::sock_t)sock_, buf, sizeof(buf), 0, (sockaddr*)&from, &flen);
        if (n > 0 && is_stop_command(buf, static_cast<size_t>(n))) {
            std::printf("[CTRL] STOP received; finishing current window.\n");
            std::fflush(stdout);
            stop_.store(true, std::memory_order_release);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

} // namespace sw
