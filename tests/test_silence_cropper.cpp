// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "audio_file.h"
#include "silence_cropper.h"

#include <cmath>

using namespace recscribe;
using Catch::Matchers::WithinAbs;

static fs::path tmp_dir() {
    fs::path dir = fs::temp_directory_path() / "recscribe_test_cropper";
    fs::create_directories(dir);
    return dir;
}

static void append_tone(std::vector<int16_t>& s, int frames, int sample_rate) {
    size_t base = s.size();
    for (int i = 0; i < frames; ++i)
        s.push_back(static_cast<int16_t>(
            12000 * std::sin(2.0 * M_PI * 300.0 * (base + i) / sample_rate)));
}

static double total_duration(const std::vector<KeepRange>& ranges) {
    double sum = 0;
    for (const auto& r : ranges) sum += r.duration;
    return sum;
}

// --- compute_keep_ranges ---

TEST_CASE("compute_keep_ranges: no silences keeps everything", "[silence_cropper]") {
    auto ranges = compute_keep_ranges(10.0, {}, 1.0);
    REQUIRE(ranges.size() == 1);
    CHECK(ranges[0].start == 0.0);
    CHECK(ranges[0].duration == 10.0);
}

TEST_CASE("compute_keep_ranges: one interior silence with padding", "[silence_cropper]") {
    auto ranges = compute_keep_ranges(10.0, {{2.0, 6.0}}, 1.0);
    REQUIRE(ranges.size() == 2);
    CHECK_THAT(ranges[0].start, WithinAbs(0.0, 1e-9));
    CHECK_THAT(ranges[0].end(), WithinAbs(2.5, 1e-9));
    CHECK_THAT(ranges[1].start, WithinAbs(5.5, 1e-9));
    CHECK_THAT(ranges[1].end(), WithinAbs(10.0, 1e-9));
    // original - cropped silence + retained pad
    CHECK_THAT(total_duration(ranges), WithinAbs(10.0 - 4.0 + 1.0, 1e-9));
}

TEST_CASE("compute_keep_ranges: leading and trailing silences", "[silence_cropper]") {
    auto ranges = compute_keep_ranges(10.0, {{0.0, 4.0}, {7.0, 10.0}}, 1.0);
    REQUIRE(ranges.size() == 3);
    CHECK_THAT(ranges[0].start, WithinAbs(0.0, 1e-9));
    CHECK_THAT(ranges[0].end(), WithinAbs(0.5, 1e-9));
    CHECK_THAT(ranges[1].start, WithinAbs(3.5, 1e-9));
    CHECK_THAT(ranges[1].end(), WithinAbs(7.5, 1e-9));
    CHECK_THAT(ranges[2].start, WithinAbs(9.5, 1e-9));
    CHECK_THAT(ranges[2].end(), WithinAbs(10.0, 1e-9));
}

TEST_CASE("compute_keep_ranges: zero pad cuts exactly at the silence", "[silence_cropper]") {
    auto ranges = compute_keep_ranges(6.0, {{1.0, 5.0}}, 0.0);
    REQUIRE(ranges.size() == 2);
    CHECK_THAT(ranges[0].end(), WithinAbs(1.0, 1e-9));
    CHECK_THAT(ranges[1].start, WithinAbs(5.0, 1e-9));
    CHECK_THAT(total_duration(ranges), WithinAbs(2.0, 1e-9));
}

TEST_CASE("compute_keep_ranges: silence shorter than the pad never duplicates audio", "[silence_cropper]") {
    auto ranges = compute_keep_ranges(10.0, {{2.0, 2.6}, {5.0, 8.0}}, 1.0);
    for (size_t i = 1; i < ranges.size(); ++i)
        CHECK(ranges[i].start >= ranges[i - 1].end() - 1e-9);
    CHECK(total_duration(ranges) <= 10.0 + 1e-9);
    // Short gap kept whole, long gap cropped to its pad
    CHECK_THAT(total_duration(ranges), WithinAbs(10.0 - 3.0 + 1.0, 1e-9));
    REQUIRE_FALSE(ranges.empty());
    CHECK_THAT(ranges.back().start, WithinAbs(7.5, 1e-9));
}

TEST_CASE("compute_keep_ranges: ranges stay inside the file", "[silence_cropper]") {
    auto ranges = compute_keep_ranges(5.0, {{3.0, 5.0}}, 4.0);
    for (const auto& r : ranges) {
        CHECK(r.start >= 0.0);
        CHECK(r.end() <= 5.0 + 1e-9);
        CHECK(r.duration > 0.0);
    }
}

// --- crop_silences ---

TEST_CASE("crop_silences: splices speech losslessly", "[silence_cropper]") {
    const int sr = 16000;
    auto dir = tmp_dir();
    fs::path wav = dir / "meeting.wav";

    std::vector<int16_t> samples;
    append_tone(samples, sr, sr);          // 0-1 s
    samples.insert(samples.end(), 4 * sr, 0);  // 1-5 s
    append_tone(samples, sr, sr);          // 5-6 s
    write_wav(wav, samples, sr, 1);
    auto original_size = fs::file_size(wav);

    auto res = crop_silences(wav, 3.0, 1.0);
    CHECK(res.output_path == dir / "meeting_cropped.wav");
    REQUIRE(fs::exists(res.output_path));
    CHECK(res.regions_cropped == 1);
    CHECK_THAT(res.original_duration, WithinAbs(6.0, 1e-9));
    CHECK_THAT(res.new_duration, WithinAbs(3.0, 1e-9));
    CHECK_THAT(res.time_saved, WithinAbs(3.0, 1e-9));

    AudioInfo info;
    auto in = read_audio_mono(wav);
    auto out = read_audio_mono(res.output_path, &info);
    CHECK(info.sample_rate == sr);
    CHECK(info.channels == 1);
    CHECK((info.format & SF_FORMAT_SUBMASK) == SF_FORMAT_PCM_16);
    REQUIRE(out.size() == static_cast<size_t>(3 * sr));

    // Kept [0, 1.5) then [4.5, 6.0)
    const size_t first = static_cast<size_t>(1.5 * sr);
    bool exact = true;
    for (size_t i = 0; i < first; ++i)
        if (out[i] != in[i]) { exact = false; break; }
    for (size_t i = first; i < out.size(); ++i)
        if (out[i] != in[i - first + static_cast<size_t>(4.5 * sr)]) { exact = false; break; }
    CHECK(exact);

    // Original untouched
    CHECK(fs::file_size(wav) == original_size);

    fs::remove_all(dir);
}

TEST_CASE("crop_silences: nothing to crop returns the original path", "[silence_cropper]") {
    const int sr = 16000;
    auto dir = tmp_dir();
    fs::path wav = dir / "busy.wav";

    std::vector<int16_t> samples;
    append_tone(samples, 2 * sr, sr);
    samples.insert(samples.end(), sr, 0);  // 1 s gap, under the 3 s minimum
    append_tone(samples, 2 * sr, sr);
    write_wav(wav, samples, sr, 1);

    auto res = crop_silences(wav, 3.0, 1.0);
    CHECK(res.output_path == wav);
    CHECK(res.regions_cropped == 0);
    CHECK(res.new_duration == res.original_duration);
    CHECK(res.time_saved == 0.0);
    CHECK_FALSE(fs::exists(dir / "busy_cropped.wav"));

    fs::remove_all(dir);
}

TEST_CASE("crop_silences: replaces an existing cropped file", "[silence_cropper]") {
    const int sr = 8000;
    auto dir = tmp_dir();
    fs::path wav = dir / "again.wav";
    fs::path stale = dir / "again_cropped.wav";
    write_text_file(stale, "stale output");

    std::vector<int16_t> samples;
    append_tone(samples, sr, sr);
    samples.insert(samples.end(), 5 * sr, 0);
    append_tone(samples, sr, sr);
    write_wav(wav, samples, sr, 1);

    auto res = crop_silences(wav, 3.0, 1.0);
    REQUIRE(res.output_path == stale);
    CHECK_THAT(probe_audio(stale).duration(), WithinAbs(res.new_duration, 1e-3));

    fs::remove_all(dir);
}

TEST_CASE("crop_silences: cancellation removes partial output", "[silence_cropper]") {
    const int sr = 16000;
    auto dir = tmp_dir();
    fs::path wav = dir / "cancel.wav";

    std::vector<int16_t> samples;
    append_tone(samples, sr, sr);
    samples.insert(samples.end(), 4 * sr, 0);
    append_tone(samples, sr, sr);
    write_wav(wav, samples, sr, 1);

    StopToken stop;
    stop.request();
    try {
        crop_silences(wav, 3.0, 1.0, -40.0, &stop);
        FAIL("expected throw");
    } catch (const PipelineError& e) {
        CHECK(e.kind() == ErrorKind::ExportFailed);
    }
    CHECK_FALSE(fs::exists(dir / "cancel_cropped.wav"));
    CHECK(fs::exists(wav));

    fs::remove_all(dir);
}

TEST_CASE("crop_silences: missing input", "[silence_cropper]") {
    try {
        crop_silences("/nonexistent/recscribe/in.wav", 3.0, 1.0);
        FAIL("expected throw");
    } catch (const PipelineError& e) {
        CHECK(e.kind() == ErrorKind::FileNotFound);
    }
}
