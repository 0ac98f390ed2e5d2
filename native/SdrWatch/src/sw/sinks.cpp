#include "sw/sinks.hpp"
#include <nlohmann/json.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <utility>

#include "sw/net.hpp"

#ifndef _WIN32
  #include <spawn.h>
  #include <sys/wait.h>
  extern char** environ;
#endif

namespace sw {

std::string detection_json(const Detection& d) {
    nlohmann::json j = {
        {"time_utc",    d.time_utc},
        {"f_center_hz", d.seg.f_center_hz},
        {"f_low_hz",    d.seg.f_low_hz},
        {"f_high_hz",   d.seg.f_high_hz},
        {"peak_db",     d.seg.peak_db},
        {"noise_db",    d.seg.noise_db},
        {"snr_db",      d.seg.snr_db},
        {"service",     d.label.service},
        {"region",      d.label.region},
        {"notes",       d.label.notes},
        {"is_new",      d.is_new},
    };
    // Bandplan'dan gelen bozuk UTF-8 fırlatmasın
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string new_signal_text(const Detection& d) {
    char buf[256];
    std::snprintf(buf, sizeof(buf), "%.6f MHz; SNR %.1f dB; %s %s",
                  d.seg.f_center_hz / 1e6, d.seg.snr_db,
                  d.label.service.empty() ? "Unknown" : d.label.service.c_str(),
                  d.label.region.c_str());
    return buf;
}

bool JsonlSink::emit(const Detection& d) {
    if (path_.empty()) return false;
    std::ofstream f(path_, std::ios::app);
    if (!f) return false;
    f << detection_json(d) << '\n';
    f.flush();
    return static_cast<bool>(f);
}

DesktopNotifier::DesktopNotifier(std::string program) : program_(std::move(program)) {}

DesktopNotifier::~DesktopNotifier() { reap(); }

size_t DesktopNotifier::reap() {
#ifndef _WIN32
    // Sadece kendi çocuklarımız; başka alt süreçlerin durumuna dokunulmaz
    size_t done = 0;
    for (size_t i = 0; i < children_.size();) {
        const pid_t r = ::waitpid(static_cast<pid_t>(children_[i]), nullptr, WNOHANG);
        if (r == 0) { ++i; continue; }
        children_[i] = children_.back();
        children_.pop_back();
        ++done;
    }
    return done;
#else
    return 0;
#endif
}

bool DesktopNotifier::emit(const Detection& d) {
    if (!d.is_new) return true;
#ifdef _WIN32
    (void)d;
    return false;
#else
    reap();

    std::string title = "SdrWatch: New signal";
    std::string body  = new_signal_text(d);
    std::string prog  = program_;
    char* argv[] = { &prog[0], &title[0], &body[0], nullptr };
    pid_t pid = 0;
    if (::posix_spawnp(&pid, prog.c_str(), nullptr, nullptr, argv, environ) != 0) return false;
    children_.push_back(static_cast<int64_t>(pid));
    return true;
#endif
}

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port) {
    const auto pos = s.rfind(':');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= s.size()) return false;
    char* end = nullptr;
    const long p = std::strtol(s.c_str() + pos + 1, &end, 10);
    if (!end || *end != '\0' || p <= 0 || p > 65535) return false;
    host = s.substr(0, pos);
    port = static_cast<uint16_t>(p);
    return true;
}

UdpNotifier::UdpNotifier(const std::string& ip, uint16_t port) {
    sockaddr_in sa{};
    if (!net::ipv4_addr(ip.c_str(), port, sa)) return;

    const net::sock_t fd = net::udp_socket();
    if (fd == net::kBadSock) return;
    net::set_nonblock(fd);
    if (::connect(fd, (sockaddr*)&sa, sizeof(sa)) != 0) {
        net::closesock(fd);
        return;
    }
    _fd = (socket_t)fd;
    _ok = true;
}

UdpNotifier::~UdpNotifier() {
    if (_ok) net::closesock((net::sock_t)_fd);
}

bool UdpNotifier::emit(const Detection& d) {
    if (!_ok) return false;
    const std::string msg = detection_json(d);
#ifdef _WIN32
    const int n = ::send((net::sock_t)_fd, msg.data(), (int)msg.size(), 0);
#else
    const ssize_t n = ::send(_fd, msg.data(), msg.size(), 0);
#endif
    return n == (decltype(n))msg.size();
}

} // namespace sw
