#include <catch2/catch.hpp>
#include "sw/sinks.hpp"
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace sw;
namespace fs = std::filesystem;

namespace {

Detection sample(bool fresh) {
    Detection d;
    d.scan_id = 1;
    d.time_utc = "2026-01-01T00:00:00.000000+00:00";
    d.seg.f_low_hz = 433900000;
    d.seg.f_center_hz = 433920000;
    d.seg.f_high_hz = 433940000;
    d.seg.peak_db = -45.5;
    d.seg.noise_db = -92.0;
    d.seg.snr_db = 46.5;
    d.label = {"ISM/SRD", "ITU-R1 (EU)", "Short-range devices"};
    d.is_new = fresh;
    return d;
}

std::vector<std::string> lines(const fs::path& p) {
    std::vector<std::string> out;
    std::ifstream f(p);
    std::string l;
    while (std::getline(f, l)) out.push_back(l);
    return out;
}

} // namespace

TEST_CASE("Detection record carries every field", "[sinks]") {
    const std::string s = detection_json(sample(true));
    CHECK(s.find('\n') == std::string::npos);

    const auto j = nlohmann::json::parse(s);
    CHECK(j.at("f_center_hz").get<int64_t>() == 433920000);
    CHECK(j.at("f_low_hz").get<int64_t>() == 433900000);
    CHECK(j.at("f_high_hz").get<int64_t>() == 433940000);
    CHECK(j.at("snr_db").get<double>() == Approx(46.5));
    CHECK(j.at("service").get<std::string>() == "ISM/SRD");
    CHECK(j.at("is_new").get<bool>());
    CHECK(j.at("time_utc").get<std::string>() == "2026-01-01T00:00:00.000000+00:00");
}

TEST_CASE("Invalid UTF-8 in labels does not throw", "[sinks]") {
    Detection d = sample(false);
    d.label.notes = "bad \xC3\x28 byte";
    std::string s;
    REQUIRE_NOTHROW(s = detection_json(d));
    CHECK_NOTHROW(nlohmann::json::parse(s));
}

TEST_CASE("JSONL sink appends one line per detection", "[sinks]") {
    const fs::path p = fs::temp_directory_path() / "sdrwatch_test_sink.jsonl";
    fs::remove(p);

    JsonlSink sink(p.string());
    CHECK(std::string(sink.name()) == "jsonl");
    REQUIRE(sink.emit(sample(true)));
    REQUIRE(sink.emit(sample(false)));

    const auto l = lines(p);
    REQUIRE(l.size() == 2);
    CHECK(nlohmann::json::parse(l[0]).at("is_new").get<bool>());
    CHECK_FALSE(nlohmann::json::parse(l[1]).at("is_new").get<bool>());
    fs::remove(p);
}

TEST_CASE("JSONL sink reports an unwritable path", "[sinks]") {
    JsonlSink sink("/nonexistent/dir/out.jsonl");
    CHECK_FALSE(sink.emit(sample(true)));
    JsonlSink empty("");
    CHECK_FALSE(empty.emit(sample(true)));
}

TEST_CASE("Desktop notifier ignores known signals", "[sinks]") {
    DesktopNotifier n;
    CHECK(n.emit(sample(false)));
    CHECK(n.pending_children() == 0);
}

#ifndef _WIN32
TEST_CASE("Desktop notifier reaps its own children", "[sinks]") {
    DesktopNotifier n("true");
    REQUIRE(n.emit(sample(true)));
    CHECK(n.pending_children() == 1);

    // "true" hemen çıkar; toplanana kadar bekle
    for (int i=0; i<100 && n.pending_children() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        n.reap();
    }
    CHECK(n.pending_children() == 0);
}

TEST_CASE("Desktop notifier reports a missing program", "[sinks]") {
    DesktopNotifier n("sdrwatch-no-such-notifier");
    CHECK_FALSE(n.emit(sample(true)));
    CHECK(n.pending_children() == 0);
}
#endif

TEST_CASE("Notification text", "[sinks]") {
    CHECK(new_signal_text(sample(true)) == "433.920000 MHz; SNR 46.5 dB; ISM/SRD ITU-R1 (EU)");
    Detection d = sample(true);
    d.label = {};
    CHECK(new_signal_text(d).find("Unknown") != std::string::npos);
}

TEST_CASE("host:port parsing", "[sinks]") {
    std::string host;
    uint16_t port = 0;
    REQUIRE(parse_host_port("127.0.0.1:5005", host, port));
    CHECK(host == "127.0.0.1");
    CHECK(port == 5005);

    CHECK_FALSE(parse_host_port("127.0.0.1", host, port));
    CHECK_FALSE(parse_host_port(":5005", host, port));
    CHECK_FALSE(parse_host_port("host:", host, port));
    CHECK_FALSE(parse_host_port("host:70000", host, port));
    CHECK_FALSE(parse_host_port("host:12ab", host, port));
}

TEST_CASE("UDP notifier fails softly on a bad address", "[sinks]") {
    UdpNotifier u("not-an-ip", 5005);
    CHECK_FALSE(u.ok());
    CHECK_FALSE(u.emit(sample(true)));

    UdpNotifier lo("127.0.0.1", 59999);
    REQUIRE(lo.ok());
    CHECK(std::string(lo.name()) == "udp");
}
