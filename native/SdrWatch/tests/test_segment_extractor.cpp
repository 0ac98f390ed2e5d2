#include <catch2/catch.hpp>
#include "sw/segment_extractor.hpp"
#include "sw/noise_model.hpp"

using namespace sw;

namespace {

struct Frame {
    std::vector<double>  freqs;
    std::vector<double>  psd;
    std::vector<uint8_t> above;
    std::vector<double>  noise;
};

// Maske -> sentetik spektrum: üst binler -40 dB, diğerleri -90 dB
Frame frame_from_mask(const std::vector<uint8_t>& mask, double f0 = 100e6, double df = 1e3) {
    Frame f;
    f.above = mask;
    for (size_t i=0; i<mask.size(); ++i) {
        f.freqs.push_back(f0 + df * static_cast<double>(i));
        f.psd.push_back(mask[i] ? -40.0 : -90.0);
        f.noise.push_back(-90.0);
    }
    return f;
}

std::vector<Segment> run(const Frame& f, int guard, int min_width, CenterMode c = CenterMode::Peak) {
    return SegmentExtractor({guard, min_width, c}).extract(f.freqs, f.psd, f.above, f.noise);
}

} // namespace

TEST_CASE("Worked example yields one segment", "[segment]") {
    Frame f;
    f.freqs = {97e6, 98e6, 99e6, 100e6, 101e6, 102e6, 103e6};
    f.psd   = {-90, -90, -90, -40, -40, -90, -90};
    NoiseConfig nc;
    nc.mode = CfarMode::Off;
    nc.threshold_db = 10.0;
    const auto ne = NoiseModel(nc).estimate(f.psd);

    const auto segs = SegmentExtractor({0, 2, CenterMode::Peak})
                          .extract(f.freqs, f.psd, ne.above, ne.noise_db);
    REQUIRE(segs.size() == 1);
    const Segment& s = segs[0];
    CHECK(s.first_bin == 3);
    CHECK(s.last_bin == 4);
    CHECK(s.peak_bin == 3);
    CHECK(s.peak_db == Approx(-40.0));
    CHECK(s.noise_db == Approx(-90.0));
    CHECK(s.snr_db == Approx(50.0));
    CHECK(s.f_low_hz == 100000000);
    CHECK(s.f_high_hz == 101000000);
    CHECK(s.f_center_hz == 100000000);
}

TEST_CASE("All-below mask produces nothing", "[segment]") {
    const auto f = frame_from_mask(std::vector<uint8_t>(64, 0));
    CHECK(run(f, 1, 1).empty());
    CHECK(run(f, 0, 2).empty());
}

TEST_CASE("Gap within guard merges, wider gap splits", "[segment]") {
    SECTION("single gap, guard 1 merges") {
        const auto segs = run(frame_from_mask({1, 1, 0, 1, 1}), 1, 2);
        REQUIRE(segs.size() == 1);
        CHECK(segs[0].first_bin == 0);
        CHECK(segs[0].last_bin == 4);
    }
    SECTION("single gap, guard 0 splits") {
        const auto segs = run(frame_from_mask({1, 1, 0, 1, 1}), 0, 2);
        REQUIRE(segs.size() == 2);
        CHECK(segs[0].last_bin == 1);
        CHECK(segs[1].first_bin == 3);
    }
    SECTION("two-bin gap, guard 1 splits") {
        const auto segs = run(frame_from_mask({1, 1, 0, 0, 1, 1}), 1, 2);
        REQUIRE(segs.size() == 2);
    }
    SECTION("two-bin gap, guard 2 merges") {
        const auto segs = run(frame_from_mask({1, 1, 0, 0, 1, 1}), 2, 2);
        REQUIRE(segs.size() == 1);
        CHECK(segs[0].last_bin == 5);
    }
}

TEST_CASE("Runs narrower than min width are dropped", "[segment]") {
    const auto f = frame_from_mask({0, 1, 0, 0, 1, 1, 1, 0});
    const auto segs = run(f, 0, 2);
    REQUIRE(segs.size() == 1);
    CHECK(segs[0].first_bin == 4);
    CHECK(segs[0].last_bin == 6);

    CHECK(run(f, 0, 4).empty());
    CHECK(run(f, 0, 1).size() == 2);
}

TEST_CASE("Trailing gap bins do not widen a segment", "[segment]") {
    const auto segs = run(frame_from_mask({0, 1, 1, 0, 0, 0}), 2, 2);
    REQUIRE(segs.size() == 1);
    CHECK(segs[0].last_bin == 2);
    CHECK(segs[0].f_high_hz == 100002000);
}

TEST_CASE("Center convention", "[segment]") {
    auto f = frame_from_mask({0, 0, 0, 1, 1, 1, 1, 0});
    f.psd[3] = -30.0;   // tepe ilk binde

    SECTION("peak") {
        const auto segs = run(f, 0, 2, CenterMode::Peak);
        REQUIRE(segs.size() == 1);
        CHECK(segs[0].center_bin == 3);
        CHECK(segs[0].f_center_hz == 100003000);
        CHECK(segs[0].snr_db == Approx(60.0));
    }
    SECTION("midpoint") {
        const auto segs = run(f, 0, 2, CenterMode::Midpoint);
        REQUIRE(segs.size() == 1);
        CHECK(segs[0].peak_bin == 3);
        CHECK(segs[0].center_bin == 5);
        CHECK(segs[0].f_center_hz == 100005000);
    }
}

TEST_CASE("First maximum wins on ties", "[segment]") {
    const auto segs = run(frame_from_mask({1, 1, 1}), 0, 1);
    REQUIRE(segs.size() == 1);
    CHECK(segs[0].peak_bin == 0);
}

TEST_CASE("Mismatched inputs give no segments", "[segment]") {
    auto f = frame_from_mask({1, 1, 1});
    f.noise.pop_back();
    CHECK(run(f, 0, 1).empty());
}
