// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "provider.h"

#include <optional>
#include <string>
#include <vector>

namespace recscribe {

// ---------------------------------------------------------------------------
// Transcript types
// ---------------------------------------------------------------------------

struct TranscriptSegment {
    double start = 0.0;  // seconds
    double end = 0.0;
    std::string text;
    std::optional<std::string> speaker;  // e.g. "speaker_0", set by diarization
};

/// AI-inferred identity for one diarized speaker.
struct SpeakerLabel {
    std::string speaker_id;  // original label, e.g. "speaker_0"
    std::string name;        // "Unknown" when not inferable
    double confidence = 0.0; // 0..1
    std::string evidence;
    std::string role;
};

struct TranscriptionOptions {
    Provider provider = Provider::OpenAI;
    std::string model_id;  // empty = provider default
    std::string language;  // empty = auto-detect

    bool crop_silences = false;
    double silence_crop_threshold_seconds = 3.0;
    double silence_threshold_db = -40.0;
    double keep_pad_seconds = 1.0;

    bool auto_compress = true;
    bool enable_diarization = true;
    bool identify_speakers = true;
    bool generate_title = true;

    int upload_timeout_seconds = 0;  // 0 = derive from file size
    std::string meeting_title;       // context for speaker naming
};

struct TranscriptionResult {
    std::string text;
    double duration_seconds = 0.0;
    int cost_cents = 0;
    std::vector<TranscriptSegment> segments;
    std::optional<int> speaker_count;
    std::optional<std::string> title;
    std::vector<SpeakerLabel> speaker_labels;
    std::string language;

    Provider provider = Provider::None;
    std::string model_id;
    double processing_seconds = 0.0;
    bool was_compressed = false;
    bool was_silence_cropped = false;

    /// Format as timestamped text: "[MM:SS - MM:SS] speaker_0: text".
    /// Falls back to the plain text when there are no segments.
    std::string to_string() const;
};

struct DictationResult {
    std::string text;
    double latency_seconds = 0.0;
    int cost_cents = 0;
};

/// "MM:SS" with minutes allowed to exceed 59.
std::string format_timestamp(double seconds);

} // namespace recscribe
