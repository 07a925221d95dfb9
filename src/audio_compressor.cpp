// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "audio_compressor.h"
#include "audio_file.h"
#include "log.h"

#include <system_error>
#include <vector>

namespace recscribe {

namespace {

constexpr double QUALITY_STEPS[] = {0.4, 0.2, 0.0};
constexpr int64_t CHUNK_FRAMES = 65536;

void encode_mono_vorbis(const fs::path& input, const fs::path& output,
                        double quality, const StopToken* stop) {
    AudioReader reader(input);
    const AudioInfo& info = reader.info();

    AudioWriter writer(output, SF_FORMAT_OGG | SF_FORMAT_VORBIS, info.sample_rate, 1);
    writer.set_vbr_quality(quality);

    std::vector<double> buf(static_cast<size_t>(CHUNK_FRAMES) * info.channels);
    std::vector<double> mono(static_cast<size_t>(CHUNK_FRAMES));

    for (;;) {
        if (stop && stop->stop_requested())
            throw PipelineError(ErrorKind::Cancelled, "Compression cancelled");

        int64_t n = reader.read(buf.data(), CHUNK_FRAMES);
        if (n <= 0) break;

        for (int64_t i = 0; i < n; ++i) {
            double sum = 0.0;
            for (int ch = 0; ch < info.channels; ++ch)
                sum += buf[i * info.channels + ch];
            mono[i] = sum / info.channels;
        }
        writer.write(mono.data(), n);
    }
    writer.close();
}

} // anonymous namespace

CompressionResult compress_audio(const fs::path& path, int64_t target_bytes,
                                 const StopToken* stop) {
    CompressionResult result;
    result.original_size = file_size_bytes(path);
    if (result.original_size < 0)
        throw PipelineError(ErrorKind::FileNotFound, "Audio file not found: " + path.string());

    fs::path output = sibling_with_suffix(path, "_compressed", "ogg");

    for (double quality : QUALITY_STEPS) {
        std::error_code ec;
        fs::remove(output, ec);

        try {
            encode_mono_vorbis(path, output, quality, stop);
        } catch (const PipelineError& e) {
            fs::remove(output, ec);
            if (e.kind() == ErrorKind::Cancelled)
                throw;
            throw PipelineError(ErrorKind::CompressionFailed,
                                std::string("Audio compression failed: ") + e.what());
        }

        result.output_path = output;
        result.compressed_size = file_size_bytes(output);
        result.quality = quality;
        log_info("Compressed %s at quality %.1f: %lld -> %lld bytes (target %lld)",
                 path.filename().c_str(), quality,
                 (long long)result.original_size, (long long)result.compressed_size,
                 (long long)target_bytes);

        if (result.compressed_size <= target_bytes)
            break;
    }

    return result;
}

} // namespace recscribe
