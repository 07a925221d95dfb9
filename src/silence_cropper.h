// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "silence_detector.h"
#include "util.h"

#include <vector>

namespace recscribe {

/// A stretch of the source timeline that survives cropping.
struct KeepRange {
    double start;     // seconds
    double duration;

    double end() const { return start + duration; }
};

struct CropResult {
    fs::path output_path;
    double original_duration = 0.0;
    double new_duration = 0.0;
    int regions_cropped = 0;
    double time_saved = 0.0;
};

/// Complement of `silences` over [0, total], leaving pad/2 of each silence
/// on either side of the speech it borders.
std::vector<KeepRange> compute_keep_ranges(double total_duration,
                                           const std::vector<SilenceRegion>& silences,
                                           double keep_pad);

/// Detect silences of at least min_silence_duration and write
/// <stem>_cropped.<ext> next to the input with them removed.
/// With nothing to crop the original path is returned and no file is written.
/// Throws PipelineError: FileNotFound, UnreadableAudio, NoAudioTrack, ExportFailed.
CropResult crop_silences(const fs::path& path, double min_silence_duration,
                         double keep_pad,
                         double threshold_db = DEFAULT_SILENCE_THRESHOLD_DB,
                         const StopToken* stop = nullptr);

} // namespace recscribe
