#include <catch2/catch.hpp>
#include "sw/ctrl_server.hpp"
#include "sw/net.hpp"

#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>

using namespace sw;

namespace {

// 127.0.0.1:port'a tek datagram
bool send_loopback(uint16_t port, const char* msg) {
    const net::sock_t s = net::udp_socket();
    if (s == net::kBadSock) return false;
    sockaddr_in sa{};
    net::ipv4_addr("127.0.0.1", port, sa);
    const auto n = ::sendto(s, msg, static_cast<int>(std::strlen(msg)), 0, (sockaddr*)&sa, sizeof(sa));
    net::closesock(s);
    return n == static_cast<decltype(n)>(std::strlen(msg));
}

bool wait_for(const std::atomic<bool>& flag, int ms) {
    for (int i=0; i<ms/10 && !flag.load(); ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    return flag.load();
}

} // namespace

TEST_CASE("Stop commands", "[ctrl]") {
    CHECK(is_stop_command("STOP", 4));
    CHECK(is_stop_command("stop\n", 5));
    CHECK(is_stop_command("please Quit", 11));
    CHECK(is_stop_command("exit", 4));
    CHECK_FALSE(is_stop_command("STATUS", 6));
    CHECK_FALSE(is_stop_command("STO", 3));
    CHECK_FALSE(is_stop_command("", 0));
}

TEST_CASE("Control server raises the stop flag on STOP", "[ctrl]") {
    std::atomic<bool> stop{false};
    CtrlServer srv(stop, 0);
    REQUIRE(srv.start());
    REQUIRE(srv.port() != 0);

    REQUIRE(send_loopback(srv.port(), "status"));
    CHECK_FALSE(wait_for(stop, 200));

    REQUIRE(send_loopback(srv.port(), "stop"));
    CHECK(wait_for(stop, 2000));
    srv.stop();
}

TEST_CASE("Control server port conflict is reported", "[ctrl]") {
    std::atomic<bool> stop{false};
    CtrlServer a(stop, 0);
    REQUIRE(a.start());

    CtrlServer b(stop, a.port());
    CHECK_FALSE(b.start());
    b.stop();   // başlamamış sunucuda güvenli
    CHECK_FALSE(stop.load());
}
