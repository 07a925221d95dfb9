// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "audio_file.h"
#include "log.h"

#include <cstdio>
#include <system_error>

namespace recscribe {

// ---------------------------------------------------------------------------
// AudioReader
// ---------------------------------------------------------------------------

AudioReader::AudioReader(const fs::path& path) : path_(path) {
    std::error_code ec;
    if (!fs::exists(path, ec) || !fs::is_regular_file(path, ec))
        throw PipelineError(ErrorKind::FileNotFound, "Audio file not found: " + path.string());

    SF_INFO sfinfo = {};
    sf_ = sf_open(path.c_str(), SFM_READ, &sfinfo);
    if (!sf_)
        throw PipelineError(ErrorKind::UnreadableAudio,
                            "Failed to read audio: " + path.string() +
                            " (" + sf_strerror(nullptr) + ")");

    info_.frames = sfinfo.frames;
    info_.sample_rate = sfinfo.samplerate;
    info_.channels = sfinfo.channels;
    info_.format = sfinfo.format;

    if (info_.channels <= 0 || info_.frames <= 0 || info_.sample_rate <= 0) {
        sf_close(sf_);
        sf_ = nullptr;
        throw PipelineError(ErrorKind::NoAudioTrack,
                            "No audio track found in file: " + path.string());
    }
}

AudioReader::~AudioReader() {
    if (sf_)
        sf_close(sf_);
}

AudioReader::AudioReader(AudioReader&& other) noexcept
    : sf_(other.sf_), info_(other.info_), path_(std::move(other.path_)) {
    other.sf_ = nullptr;
}

AudioReader& AudioReader::operator=(AudioReader&& other) noexcept {
    if (this != &other) {
        if (sf_)
            sf_close(sf_);
        sf_ = other.sf_;
        info_ = other.info_;
        path_ = std::move(other.path_);
        other.sf_ = nullptr;
    }
    return *this;
}

void AudioReader::set_normalized(bool normalized) {
    int flag = normalized ? SF_TRUE : SF_FALSE;
    sf_command(sf_, SFC_SET_NORM_FLOAT, nullptr, flag);
    sf_command(sf_, SFC_SET_NORM_DOUBLE, nullptr, flag);
}

int64_t AudioReader::read(float* dst, int64_t frames) {
    sf_count_t n = sf_readf_float(sf_, dst, frames);
    if (n < 0)
        throw PipelineError(ErrorKind::UnreadableAudio,
                            "Failed to read audio: " + path_.string() + " (" + sf_strerror(sf_) + ")");
    return n;
}

int64_t AudioReader::read(double* dst, int64_t frames) {
    sf_count_t n = sf_readf_double(sf_, dst, frames);
    if (n < 0)
        throw PipelineError(ErrorKind::UnreadableAudio,
                            "Failed to read audio: " + path_.string() + " (" + sf_strerror(sf_) + ")");
    return n;
}

void AudioReader::seek(int64_t frame) {
    if (sf_seek(sf_, frame, SEEK_SET) < 0)
        throw PipelineError(ErrorKind::UnreadableAudio,
                            "Seek to frame " + std::to_string(frame) + " failed: " + path_.string());
}

// ---------------------------------------------------------------------------
// AudioWriter
// ---------------------------------------------------------------------------

AudioWriter::AudioWriter(const fs::path& path, int format, int sample_rate, int channels)
    : path_(path) {
    SF_INFO info = {};
    info.samplerate = sample_rate;
    info.channels = channels;
    info.format = format;

    if (!sf_format_check(&info))
        throw PipelineError(ErrorKind::ExportFailed,
                            "Unsupported output format for " + path.string());

    sf_ = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!sf_)
        throw PipelineError(ErrorKind::ExportFailed,
                            "Failed to open audio for writing: " + path.string() +
                            " (" + sf_strerror(nullptr) + ")");
}

AudioWriter::~AudioWriter() {
    if (sf_)
        sf_close(sf_);
}

void AudioWriter::set_normalized(bool normalized) {
    int flag = normalized ? SF_TRUE : SF_FALSE;
    sf_command(sf_, SFC_SET_NORM_FLOAT, nullptr, flag);
    sf_command(sf_, SFC_SET_NORM_DOUBLE, nullptr, flag);
}

void AudioWriter::set_vbr_quality(double quality) {
    sf_command(sf_, SFC_SET_VBR_ENCODING_QUALITY, &quality, sizeof(quality));
}

void AudioWriter::write(const double* src, int64_t frames) {
    sf_count_t written = sf_writef_double(sf_, src, frames);
    if (written != frames)
        throw PipelineError(ErrorKind::ExportFailed,
                            "Audio write incomplete: " + path_.string() +
                            " (" + sf_strerror(sf_) + ")");
}

void AudioWriter::close() {
    if (!sf_) return;
    int rc = sf_close(sf_);
    sf_ = nullptr;
    if (rc != 0)
        throw PipelineError(ErrorKind::ExportFailed,
                            "Failed to finalize audio file: " + path_.string() +
                            " (" + sf_error_number(rc) + ")");
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

AudioInfo probe_audio(const fs::path& path) {
    AudioReader reader(path);
    return reader.info();
}

double audio_duration_seconds(const fs::path& path) {
    try {
        return probe_audio(path).duration();
    } catch (const PipelineError& e) {
        log_debug("duration probe failed: %s", e.what());
        return 0.0;
    }
}

int64_t file_size_bytes(const fs::path& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return -1;
    return static_cast<int64_t>(size);
}

void write_wav(const fs::path& path, const std::vector<int16_t>& samples,
               int sample_rate, int channels) {
    SF_INFO info = {};
    info.samplerate = sample_rate;
    info.channels = channels;
    info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SNDFILE* sf = sf_open(path.c_str(), SFM_WRITE, &info);
    if (!sf)
        throw RecscribeError("Failed to open WAV for writing: " + path.string() +
                             " (" + sf_strerror(nullptr) + ")");

    sf_count_t written = sf_write_short(sf, samples.data(), samples.size());
    sf_close(sf);

    if (written != static_cast<sf_count_t>(samples.size()))
        throw RecscribeError("WAV write incomplete: " + path.string());
}

std::vector<float> read_audio_mono(const fs::path& path, AudioInfo* info_out) {
    AudioReader reader(path);
    const AudioInfo& info = reader.info();
    if (info_out) *info_out = info;

    std::vector<float> samples(static_cast<size_t>(info.frames) * info.channels);
    int64_t read = reader.read(samples.data(), info.frames);
    if (read <= 0)
        throw PipelineError(ErrorKind::NoAudioTrack, "Audio file contains no data: " + path.string());

    if (info.channels == 1) {
        samples.resize(static_cast<size_t>(read));
        return samples;
    }

    std::vector<float> mono(static_cast<size_t>(read));
    for (int64_t i = 0; i < read; ++i) {
        float sum = 0;
        for (int ch = 0; ch < info.channels; ++ch)
            sum += samples[i * info.channels + ch];
        mono[i] = sum / info.channels;
    }
    return mono;
}

} // namespace recscribe
