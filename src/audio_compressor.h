// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"

#include <cstdint>

namespace recscribe {

struct CompressionResult {
    fs::path output_path;
    int64_t original_size = 0;
    int64_t compressed_size = 0;
    double quality = 0.0;  // Vorbis VBR quality that produced the output
};

/// Re-encode to mono Ogg Vorbis as <stem>_compressed.ogg, stepping the VBR
/// quality down until the file fits in target_bytes. If even the lowest
/// quality does not fit, the smallest attempt is returned and the caller
/// decides. Throws PipelineError(CompressionFailed) if encoding fails.
CompressionResult compress_audio(const fs::path& path, int64_t target_bytes,
                                 const StopToken* stop = nullptr);

} // namespace recscribe
