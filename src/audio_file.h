// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"

#include <sndfile.h>

#include <cstdint>
#include <string>
#include <vector>

namespace recscribe {

struct AudioInfo {
    int64_t frames = 0;
    int sample_rate = 0;
    int channels = 0;
    int format = 0;  // libsndfile SF_FORMAT_* major|subtype

    double duration() const {
        return sample_rate > 0 ? static_cast<double>(frames) / sample_rate : 0.0;
    }
};

// ---------------------------------------------------------------------------
// AudioReader: RAII wrapper for a libsndfile handle opened for reading
// ---------------------------------------------------------------------------

class AudioReader {
public:
    /// Throws PipelineError: FileNotFound if the path is absent,
    /// UnreadableAudio if libsndfile cannot decode it,
    /// NoAudioTrack if it has no channels or no frames.
    explicit AudioReader(const fs::path& path);
    ~AudioReader();

    AudioReader(const AudioReader&) = delete;
    AudioReader& operator=(const AudioReader&) = delete;

    AudioReader(AudioReader&& other) noexcept;
    AudioReader& operator=(AudioReader&& other) noexcept;

    const AudioInfo& info() const { return info_; }
    const fs::path& path() const { return path_; }

    /// When false, samples come back as raw integer values, which makes
    /// PCM copies bit-exact. Default true ([-1, 1]).
    void set_normalized(bool normalized);

    /// Read up to `frames` interleaved frames. Returns frames actually read.
    int64_t read(float* dst, int64_t frames);
    int64_t read(double* dst, int64_t frames);

    /// Seek to an absolute frame. Throws PipelineError(UnreadableAudio) on failure.
    void seek(int64_t frame);

private:
    SNDFILE* sf_ = nullptr;
    AudioInfo info_;
    fs::path path_;
};

// ---------------------------------------------------------------------------
// AudioWriter: RAII wrapper for a libsndfile handle opened for writing
// ---------------------------------------------------------------------------

class AudioWriter {
public:
    /// Throws PipelineError(ExportFailed) if the file cannot be created.
    AudioWriter(const fs::path& path, int format, int sample_rate, int channels);
    ~AudioWriter();

    AudioWriter(const AudioWriter&) = delete;
    AudioWriter& operator=(const AudioWriter&) = delete;

    void set_normalized(bool normalized);

    /// VBR quality for lossy encoders (0.0 = smallest, 1.0 = best).
    void set_vbr_quality(double quality);

    /// Write interleaved frames. Throws PipelineError(ExportFailed) on a short write.
    void write(const double* src, int64_t frames);

    /// Flush and close. Throws PipelineError(ExportFailed) on failure.
    void close();

private:
    SNDFILE* sf_ = nullptr;
    fs::path path_;
};

/// Open the file, report its properties, close it.
AudioInfo probe_audio(const fs::path& path);

/// Return audio duration in seconds. Returns 0 on any error.
double audio_duration_seconds(const fs::path& path);

/// File size in bytes, or -1 if the file is missing.
int64_t file_size_bytes(const fs::path& path);

/// Write S16 interleaved samples to a WAV file using libsndfile.
void write_wav(const fs::path& path, const std::vector<int16_t>& samples,
               int sample_rate = 16000, int channels = 1);

/// Read a file and return float32 samples normalized to [-1, 1], downmixed to mono.
std::vector<float> read_audio_mono(const fs::path& path, AudioInfo* info = nullptr);

} // namespace recscribe
