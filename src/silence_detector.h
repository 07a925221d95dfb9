// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"

#include <vector>

namespace recscribe {

struct SilenceRegion {
    double start;  // seconds
    double end;

    double duration() const { return end - start; }
};

/// Analysis window length in seconds.
constexpr double SILENCE_WINDOW_SECONDS = 0.1;

/// Default RMS threshold below which a window counts as silent.
constexpr double DEFAULT_SILENCE_THRESHOLD_DB = -40.0;

/// 10^(db/20)
double db_to_linear(double db);

/// Scan interleaved float samples in fixed 100 ms windows and return silent
/// stretches lasting at least min_duration seconds, in ascending order.
/// A silence still open at the end of the buffer closes at the buffer's end.
std::vector<SilenceRegion> detect_silences(const std::vector<float>& samples,
                                           int channels, int sample_rate,
                                           double threshold_db,
                                           double min_duration);

/// Stream an audio file through the same scan.
/// Throws PipelineError: FileNotFound, UnreadableAudio, NoAudioTrack.
std::vector<SilenceRegion> detect_silences(const fs::path& path,
                                           double threshold_db,
                                           double min_duration);

} // namespace recscribe
