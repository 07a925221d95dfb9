// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include "transcript.h"

using namespace recscribe;

TEST_CASE("format_timestamp: MM:SS with minutes past an hour", "[transcript]") {
    CHECK(format_timestamp(0) == "00:00");
    CHECK(format_timestamp(65.9) == "01:05");
    CHECK(format_timestamp(3725) == "62:05");
    CHECK(format_timestamp(-3) == "00:00");
}

TEST_CASE("TranscriptionOptions: safe defaults", "[transcript]") {
    TranscriptionOptions opts;
    CHECK(opts.provider == Provider::OpenAI);
    CHECK_FALSE(opts.crop_silences);
    CHECK(opts.silence_crop_threshold_seconds == 3.0);
    CHECK(opts.silence_threshold_db == -40.0);
    CHECK(opts.auto_compress);
    CHECK(opts.generate_title);
    CHECK(opts.upload_timeout_seconds == 0);
}

TEST_CASE("TranscriptionResult::to_string: segments with speakers", "[transcript]") {
    TranscriptionResult r;
    r.text = "hello there general kenobi";
    r.segments.push_back({0.0, 2.5, "hello there", std::string("speaker_0")});
    r.segments.push_back({2.5, 61.0, "general kenobi", std::nullopt});

    CHECK(r.to_string() ==
          "[00:00 - 00:02] speaker_0: hello there\n"
          "[00:02 - 01:01] general kenobi\n");
}

TEST_CASE("TranscriptionResult::to_string: falls back to plain text", "[transcript]") {
    TranscriptionResult r;
    CHECK(r.to_string().empty());
    r.text = "just text";
    CHECK(r.to_string() == "just text\n");
}
