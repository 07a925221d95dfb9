// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "audio_file.h"
#include "silence_detector.h"

#include <cmath>

using namespace recscribe;
using Catch::Matchers::WithinAbs;

// Constant-amplitude "speech" and digital silence, mono at 1 kHz so one
// 100 ms window is exactly 100 frames.
static void append(std::vector<float>& buf, double seconds, float level, int channels = 1) {
    int frames = static_cast<int>(std::lround(seconds * 1000));
    for (int i = 0; i < frames * channels; ++i)
        buf.push_back((i % 2) ? level : -level);
}

TEST_CASE("db_to_linear", "[silence_detector]") {
    CHECK_THAT(db_to_linear(0), WithinAbs(1.0, 1e-12));
    CHECK_THAT(db_to_linear(-20), WithinAbs(0.1, 1e-12));
    CHECK_THAT(db_to_linear(-40), WithinAbs(0.01, 1e-12));
}

TEST_CASE("detect_silences: silence between speech", "[silence_detector]") {
    std::vector<float> buf;
    append(buf, 1.0, 0.5f);
    append(buf, 2.0, 0.0f);
    append(buf, 1.0, 0.5f);

    auto regions = detect_silences(buf, 1, 1000, -40.0, 1.0);
    REQUIRE(regions.size() == 1);
    CHECK_THAT(regions[0].start, WithinAbs(1.0, 1e-9));
    CHECK_THAT(regions[0].end, WithinAbs(3.0, 1e-9));
    CHECK_THAT(regions[0].duration(), WithinAbs(2.0, 1e-9));
}

TEST_CASE("detect_silences: trailing silence closes at end of audio", "[silence_detector]") {
    std::vector<float> buf;
    append(buf, 1.0, 0.5f);
    append(buf, 2.05, 0.0f);  // last window is short

    auto regions = detect_silences(buf, 1, 1000, -40.0, 1.0);
    REQUIRE(regions.size() == 1);
    CHECK_THAT(regions[0].start, WithinAbs(1.0, 1e-9));
    CHECK_THAT(regions[0].end, WithinAbs(3.05, 1e-9));
}

TEST_CASE("detect_silences: leading silence starts at zero", "[silence_detector]") {
    std::vector<float> buf;
    append(buf, 1.5, 0.0f);
    append(buf, 1.0, 0.5f);

    auto regions = detect_silences(buf, 1, 1000, -40.0, 1.0);
    REQUIRE(regions.size() == 1);
    CHECK_THAT(regions[0].start, WithinAbs(0.0, 1e-9));
    CHECK_THAT(regions[0].end, WithinAbs(1.5, 1e-9));
}

TEST_CASE("detect_silences: gaps shorter than the minimum are ignored", "[silence_detector]") {
    std::vector<float> buf;
    append(buf, 1.0, 0.5f);
    append(buf, 0.5, 0.0f);
    append(buf, 1.0, 0.5f);
    append(buf, 3.0, 0.0f);
    append(buf, 1.0, 0.5f);

    auto regions = detect_silences(buf, 1, 1000, -40.0, 1.0);
    REQUIRE(regions.size() == 1);
    CHECK_THAT(regions[0].start, WithinAbs(2.5, 1e-9));
    CHECK_THAT(regions[0].end, WithinAbs(5.5, 1e-9));
}

TEST_CASE("detect_silences: regions are ascending and non-overlapping", "[silence_detector]") {
    std::vector<float> buf;
    for (int i = 0; i < 4; ++i) {
        append(buf, 0.7, 0.5f);
        append(buf, 1.2, 0.0f);
    }
    auto regions = detect_silences(buf, 1, 1000, -40.0, 1.0);
    REQUIRE(regions.size() == 4);
    for (size_t i = 1; i < regions.size(); ++i)
        CHECK(regions[i].start >= regions[i - 1].end);
    for (const auto& r : regions)
        CHECK(r.end > r.start);
}

TEST_CASE("detect_silences: threshold is in dBFS RMS", "[silence_detector]") {
    std::vector<float> quiet;   // 0.005 RMS ~ -46 dB
    append(quiet, 2.0, 0.005f);
    std::vector<float> hum;     // 0.02 RMS ~ -34 dB
    append(hum, 2.0, 0.02f);

    CHECK(detect_silences(quiet, 1, 1000, -40.0, 1.0).size() == 1);
    CHECK(detect_silences(hum, 1, 1000, -40.0, 1.0).empty());
    CHECK(detect_silences(hum, 1, 1000, -30.0, 1.0).size() == 1);
}

TEST_CASE("detect_silences: multichannel frames", "[silence_detector]") {
    std::vector<float> buf;
    append(buf, 1.0, 0.5f, 2);
    append(buf, 2.0, 0.0f, 2);
    append(buf, 1.0, 0.5f, 2);

    auto regions = detect_silences(buf, 2, 1000, -40.0, 1.0);
    REQUIRE(regions.size() == 1);
    CHECK_THAT(regions[0].start, WithinAbs(1.0, 1e-9));
    CHECK_THAT(regions[0].end, WithinAbs(3.0, 1e-9));
}

TEST_CASE("detect_silences: empty or invalid buffers", "[silence_detector]") {
    CHECK(detect_silences(std::vector<float>{}, 1, 1000, -40.0, 1.0).empty());
    CHECK(detect_silences(std::vector<float>{0.0f}, 0, 1000, -40.0, 1.0).empty());
}

TEST_CASE("detect_silences: file overload matches buffer scan", "[silence_detector]") {
    fs::path dir = fs::temp_directory_path() / "recscribe_test_silence";
    fs::create_directories(dir);
    fs::path wav = dir / "gap.wav";

    std::vector<int16_t> samples;
    for (int i = 0; i < 16000; ++i) samples.push_back((i % 2) ? 16000 : -16000);
    samples.insert(samples.end(), 32000, 0);
    for (int i = 0; i < 16000; ++i) samples.push_back((i % 2) ? 16000 : -16000);
    samples.insert(samples.end(), 24000, 0);
    write_wav(wav, samples, 16000, 1);

    auto regions = detect_silences(wav, -40.0, 1.0);
    REQUIRE(regions.size() == 2);
    CHECK_THAT(regions[0].start, WithinAbs(1.0, 1e-9));
    CHECK_THAT(regions[0].end, WithinAbs(3.0, 1e-9));
    CHECK_THAT(regions[1].start, WithinAbs(4.0, 1e-9));
    CHECK_THAT(regions[1].end, WithinAbs(5.5, 1e-9));

    fs::remove_all(dir);
}

TEST_CASE("detect_silences: missing file", "[silence_detector]") {
    try {
        detect_silences(fs::path("/nonexistent/recscribe/x.wav"), -40.0, 1.0);
        FAIL("expected throw");
    } catch (const PipelineError& e) {
        CHECK(e.kind() == ErrorKind::FileNotFound);
    }
}
