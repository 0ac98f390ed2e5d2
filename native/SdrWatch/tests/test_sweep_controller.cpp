#include <catch2/catch.hpp>
#include "sw/sweep_controller.hpp"
#include "sw/sim_source.hpp"
#include "sw/sqlite_store.hpp"
#include "test_helpers.hpp"

#include <atomic>

using namespace sw;
using swtest::scalar;

namespace {

// 3 pencere: 100, 101, 102 MHz; 100.25 MHz'de bin ortalı taşıyıcı
Params small_sweep() {
    Params p;
    p.start_hz  = 100e6;
    p.stop_hz   = 102e6;
    p.step_hz   = 1e6;
    p.samp_rate = 1e6;
    p.fft_size  = 256;
    p.avg       = 2;
    p.cfar_mode = CfarMode::Off;
    p.threshold_db = 10.0;
    p.driver    = "sim";
    return p;
}

SimSource sim(int delay_ms = 0) {
    return SimSource(1e6, 0.01, {{100.25e6, 1.0}}, 12345, delay_ms);
}

// Her emit'te bayrağı kaldırır
class StopSink : public ISink {
public:
    explicit StopSink(std::atomic<bool>& f) : f_(f) {}
    const char* name() const override { return "stop"; }
    bool emit(const Detection&) override { ++count; f_ = true; return true; }
    int count = 0;
private:
    std::atomic<bool>& f_;
};

class FailingSink : public ISink {
public:
    const char* name() const override { return "failing"; }
    bool emit(const Detection&) override { ++count; return false; }
    int count = 0;
};

// Tespit yazımı hata verir; transaction çağrıları sayılır
class BrokenStore : public IStore {
public:
    std::optional<int64_t> start_scan(const ScanMeta&) override { return 1; }
    bool end_scan(int64_t, const std::string&) override { ++ended; return true; }
    bool begin_window() override { ++begun; return true; }
    bool commit_window() override { ++committed; return true; }
    void rollback_window() override { ++rolled_back; }
    bool add_detection(const Detection&) override { return false; }
    bool get_bin(int64_t k, std::optional<BaselineBin>& out) override { return mem.get_bin(k, out); }
    bool put_bin(const BaselineBin& b) override { return mem.put_bin(b); }

    MemoryBaselineStore mem;
    int ended = 0, begun = 0, committed = 0, rolled_back = 0;
};

} // namespace

TEST_CASE("Window centers step from start to stop inclusive", "[sweep]") {
    SimSource src = sim();
    SqliteStore db(":memory:");
    Bandplan bp;
    std::atomic<bool> stop{false};

    Params p = small_sweep();
    SweepController a(src, db, bp, p, stop);
    CHECK(a.window_centers() == std::vector<double>{100e6, 101e6, 102e6});

    p.stop_hz = p.start_hz;
    SweepController b(src, db, bp, p, stop);
    CHECK(b.window_centers().size() == 1);

    p.stop_hz = 101.5e6;
    SweepController c(src, db, bp, p, stop);
    CHECK(c.window_centers().size() == 2);
    CHECK(c.window_center(1) == Approx(101e6));
}

TEST_CASE("Oversized sweeps are not materialized", "[sweep]") {
    SimSource src = sim();
    SqliteStore db(":memory:");
    Bandplan bp;
    std::atomic<bool> stop{false};

    Params p = small_sweep();
    p.start_hz = 1e6;
    p.stop_hz  = 6e9;
    p.step_hz  = 1.0;
    SweepController ctl(src, db, bp, p, stop);
    CHECK(ctl.window_centers().empty());
    CHECK(ctl.window_center(1000) == Approx(1e6 + 1000.0));
}

TEST_CASE("Single cycle sweeps every window once", "[sweep]") {
    SimSource src = sim();
    SqliteStore db(":memory:");
    REQUIRE(db.ok());
    Bandplan bp;
    std::atomic<bool> stop{false};

    SweepController ctl(src, db, bp, small_sweep(), stop);
    CHECK(ctl.state() == SweepState::Idle);
    REQUIRE(ctl.run() == SweepOutcome::Completed);
    CHECK(ctl.state() == SweepState::Idle);
    CHECK(ctl.cycles_completed() == 1);
    CHECK(ctl.windows_processed() == 3);
    CHECK(src.tune_count() == 3);
    // Her pencere: fft_size ısınma + fft_size*avg
    CHECK(src.samples_read() == 3 * (256 + 256 * 2));

    CHECK(scalar(db, "SELECT COUNT(*) FROM scans") == 1);
    CHECK(scalar(db, "SELECT COUNT(*) FROM scans WHERE t_end_utc IS NOT NULL") == 1);

    // Sadece 100 MHz penceresinde tek taşıyıcı
    CHECK(ctl.detections_total() == 1);
    CHECK(scalar(db, "SELECT COUNT(*) FROM detections") == 1);
    CHECK(scalar(db, "SELECT f_center_hz FROM detections") == 100250000);
    // Her pencerenin tüm binleri baseline'a girer
    CHECK(scalar(db, "SELECT COUNT(*) FROM baseline") == 3 * 256);
    CHECK(scalar(db, "SELECT hits FROM baseline WHERE bin_hz=100250000") == 1);
}

TEST_CASE("Detections carry bandplan labels", "[sweep]") {
    SimSource src = sim();
    SqliteStore db(":memory:");
    Bandplan bp;
    std::atomic<bool> stop{false};
    SweepController ctl(src, db, bp, small_sweep(), stop);
    REQUIRE(ctl.run() == SweepOutcome::Completed);
    CHECK(swtest::text(db, "SELECT service FROM detections") == "FM Broadcast");
}

TEST_CASE("Repeat runs exactly N cycles", "[sweep]") {
    SimSource src = sim();
    SqliteStore db(":memory:");
    Bandplan bp;
    std::atomic<bool> stop{false};
    Params p = small_sweep();
    p.cycle = RepeatCycles{3};

    SweepController ctl(src, db, bp, p, stop);
    REQUIRE(ctl.run() == SweepOutcome::Completed);
    CHECK(ctl.cycles_completed() == 3);
    CHECK(ctl.windows_processed() == 9);
    CHECK(ctl.last_scan_id() == 3);
    CHECK(scalar(db, "SELECT COUNT(*) FROM scans WHERE t_end_utc IS NOT NULL") == 3);
    CHECK(scalar(db, "SELECT total_obs FROM baseline WHERE bin_hz=100250000") == 3);
}

TEST_CASE("Loop stops on an external request", "[sweep]") {
    SimSource src = sim();
    SqliteStore db(":memory:");
    Bandplan bp;
    Params p = small_sweep();
    p.cycle = LoopCycles{};

    SECTION("requested before the first cycle") {
        std::atomic<bool> stop{true};
        SweepController ctl(src, db, bp, p, stop);
        CHECK(ctl.run() == SweepOutcome::Cancelled);
        CHECK(ctl.cycles_completed() == 0);
        CHECK(scalar(db, "SELECT COUNT(*) FROM scans") == 0);
    }
    SECTION("requested during a window") {
        // İlk pencere biter, ikincisi başlamaz; scan yine kapatılır
        std::atomic<bool> stop{false};
        StopSink sink(stop);
        SweepController ctl(src, db, bp, p, stop);
        ctl.add_sink(&sink);
        CHECK(ctl.run() == SweepOutcome::Cancelled);
        CHECK(sink.count == 1);
        CHECK(ctl.windows_processed() == 1);
        CHECK(ctl.cycles_completed() == 0);
        CHECK(scalar(db, "SELECT COUNT(*) FROM detections") == 1);
        CHECK(scalar(db, "SELECT COUNT(*) FROM scans WHERE t_end_utc IS NOT NULL") == 1);
    }
}

TEST_CASE("Duration lets a started cycle finish", "[sweep]") {
    SqliteStore db(":memory:");
    Bandplan bp;
    std::atomic<bool> stop{false};
    Params p = small_sweep();

    SECTION("overrun") {
        // 3 pencere x 2 okuma x 30 ms > 50 ms
        SimSource src = sim(30);
        p.cycle = DurationCycles{0.05};
        SweepController ctl(src, db, bp, p, stop);
        REQUIRE(ctl.run() == SweepOutcome::Completed);
        CHECK(ctl.cycles_completed() == 1);
        CHECK(ctl.windows_processed() == 3);
    }
    SECTION("zero duration starts nothing") {
        SimSource src = sim();
        p.cycle = DurationCycles{0.0};
        SweepController ctl(src, db, bp, p, stop);
        REQUIRE(ctl.run() == SweepOutcome::Completed);
        CHECK(ctl.cycles_completed() == 0);
        CHECK(scalar(db, "SELECT COUNT(*) FROM scans") == 0);
    }
}

TEST_CASE("Sink failures do not stop the sweep", "[sweep]") {
    SimSource src = sim();
    SqliteStore db(":memory:");
    Bandplan bp;
    std::atomic<bool> stop{false};
    FailingSink bad;
    SweepController ctl(src, db, bp, small_sweep(), stop);
    ctl.add_sink(&bad);
    REQUIRE(ctl.run() == SweepOutcome::Completed);
    CHECK(bad.count == 1);
    CHECK(scalar(db, "SELECT COUNT(*) FROM detections") == 1);
}

TEST_CASE("Storage failure rolls the window back", "[sweep]") {
    SimSource src = sim();
    BrokenStore store;
    Bandplan bp;
    std::atomic<bool> stop{false};
    FailingSink sink;
    Params p = small_sweep();
    p.cycle = RepeatCycles{2};

    SweepController ctl(src, store, bp, p, stop);
    ctl.add_sink(&sink);
    CHECK(ctl.run() == SweepOutcome::StorageFailed);
    CHECK(store.begun == 1);
    CHECK(store.rolled_back == 1);
    CHECK(store.committed == 0);
    CHECK(store.ended == 1);
    CHECK(sink.count == 0);
    CHECK(ctl.windows_processed() == 0);
    CHECK(ctl.cycles_completed() == 0);
}

TEST_CASE("Source failure aborts the cycle", "[sweep]") {
    SimSource src = sim();
    src.close();
    SqliteStore db(":memory:");
    Bandplan bp;
    std::atomic<bool> stop{false};

    SweepController ctl(src, db, bp, small_sweep(), stop);
    CHECK(ctl.run() == SweepOutcome::SourceFailed);
    CHECK(ctl.windows_processed() == 0);
    CHECK(scalar(db, "SELECT COUNT(*) FROM scans WHERE t_end_utc IS NOT NULL") == 1);
    CHECK(scalar(db, "SELECT COUNT(*) FROM baseline") == 0);
}

TEST_CASE("Single window report", "[sweep]") {
    SimSource src = sim();
    SqliteStore db(":memory:");
    Bandplan bp;
    std::atomic<bool> stop{false};
    SweepController ctl(src, db, bp, small_sweep(), stop);

    const auto id = db.start_scan(ScanMeta{});
    REQUIRE(id);
    WindowReport rep;
    REQUIRE(ctl.process_window(*id, 100e6, rep) == SweepOutcome::Completed);
    CHECK(rep.center_hz == Approx(100e6));
    CHECK(rep.bins == 256);
    CHECK(rep.segments == 1);
    CHECK(rep.new_signals == 0);   // ilk görülen bin: ema_occ = 1
    CHECK_FALSE(rep.adaptive);
}
