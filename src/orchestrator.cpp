// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "orchestrator.h"
#include "audio_file.h"
#include "log.h"
#include "postprocess.h"
#include "silence_cropper.h"

#include <chrono>
#include <cstdio>

namespace recscribe {

namespace {

constexpr int64_t COMPRESSION_HEADROOM = 1024 * 1024;

std::string size_mb(int64_t bytes) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1fMB", bytes / (1024.0 * 1024.0));
    return buf;
}

} // anonymous namespace

Orchestrator::Orchestrator(const SecretStore& secrets, HttpTransport transport)
    : client_(secrets, std::move(transport)), compress_(compress_audio) {}

fs::path Orchestrator::fit_to_limit(const fs::path& path, const ProviderInfo& info,
                                    const TranscriptionOptions& options,
                                    const StopToken* stop,
                                    TranscriptionResult& result) const {
    int64_t size = file_size_bytes(path);
    if (size <= info.max_file_size)
        return path;

    if (!options.auto_compress) {
        int minutes = static_cast<int>(estimate_duration_seconds(size) / 60);
        throw PipelineError(ErrorKind::FileTooLarge,
                            "File is " + size_mb(size) + " (about " + std::to_string(minutes) +
                            " min of audio); " + info.display + " accepts at most " +
                            format_file_size_limit(info) +
                            ". Enable compression or silence cropping.");
    }

    int64_t target = info.max_file_size - COMPRESSION_HEADROOM;
    log_info("%s exceeds the %s limit (%s), compressing to under %s",
             path.filename().c_str(), info.display, size_mb(size).c_str(),
             size_mb(target).c_str());

    CompressionResult comp;
    try {
        comp = compress_(path, target, stop);
    } catch (const PipelineError& e) {
        if (e.kind() == ErrorKind::Cancelled || e.kind() == ErrorKind::CompressionFailed)
            throw;
        throw PipelineError(ErrorKind::CompressionFailed,
                            std::string("Audio compression failed: ") + e.what());
    }

    if (comp.compressed_size > info.max_file_size)
        throw PipelineError(ErrorKind::FileTooLarge,
                            "File is still " + size_mb(comp.compressed_size) +
                            " after compression; " + info.display + " accepts at most " +
                            format_file_size_limit(info));

    result.was_compressed = true;
    return comp.output_path;
}

void Orchestrator::post_process(const TranscriptionOptions& options,
                                TranscriptionResult& result) const {
    if (options.enable_diarization && !result.text.empty()) {
        auto speakers = unique_speakers(result.segments);
        if (!speakers.empty()) {
            result.speaker_count = static_cast<int>(speakers.size());
        } else {
            try {
                auto d = diarize_with_llm(client_, result.provider, result.text);
                if (!d.segments.empty()) {
                    result.segments = std::move(d.segments);
                    result.speaker_count = d.speaker_count;
                }
                result.cost_cents += d.cost_cents;
            } catch (const std::exception& e) {
                log_warn("Diarization skipped: %s", e.what());
            }
        }
    }

    if (options.generate_title && !result.text.empty()) {
        try {
            result.title = generate_title(client_, result.provider, result.text);
        } catch (const std::exception& e) {
            log_warn("Title generation skipped: %s", e.what());
        }
    }

    if (options.identify_speakers && result.speaker_count.value_or(0) > 1) {
        try {
            auto ident = identify_speakers(client_, result.provider, result.text,
                                           result.segments, options.meeting_title);
            result.speaker_labels = std::move(ident.labels);
            result.cost_cents += ident.cost_cents;
        } catch (const std::exception& e) {
            log_warn("Speaker identification skipped: %s", e.what());
        }
    }
}

TranscriptionResult Orchestrator::transcribe(const fs::path& path,
                                             const TranscriptionOptions& options,
                                             const StopToken* stop) const {
    auto started = std::chrono::steady_clock::now();

    const ProviderInfo& info = client_.provider_info(options.provider);
    client_.api_key(options.provider);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        throw PipelineError(ErrorKind::FileNotFound, "Audio file not found: " + path.string());

    TranscriptionResult result;
    result.provider = info.id;
    result.model_id = options.model_id.empty() ? info.default_model : options.model_id;

    // Unknown models fail before any audio work or upload.
    rate_per_minute_cents(result.model_id);

    fs::path upload_path = path;
    if (options.crop_silences && options.silence_crop_threshold_seconds > 0) {
        try {
            auto crop = crop_silences(path, options.silence_crop_threshold_seconds,
                                      options.keep_pad_seconds, options.silence_threshold_db,
                                      stop);
            if (crop.regions_cropped > 0) {
                upload_path = crop.output_path;
                result.was_silence_cropped = true;
            }
        } catch (const PipelineError& e) {
            log_warn("Silence cropping failed, uploading original: %s", e.what());
        }
    }

    if (stop && stop->stop_requested())
        throw PipelineError(ErrorKind::Cancelled, "Transcription cancelled before upload");

    upload_path = fit_to_limit(upload_path, info, options, stop, result);

    UploadOptions upload;
    upload.language = options.language;
    upload.timeout_seconds = options.upload_timeout_seconds;
    upload.stop = stop;

    auto raw = client_.upload(upload_path, info.id, result.model_id,
                              ResponseFormat::VerboseJson, upload);
    auto parsed = parse_verbose_response(raw.body, raw.http_status);

    result.text = std::move(parsed.text);
    result.segments = std::move(parsed.segments);
    result.language = parsed.language.value_or(options.language);
    result.duration_seconds = parsed.duration
        ? *parsed.duration
        : estimate_duration_seconds(file_size_bytes(upload_path));
    result.cost_cents = compute_cost_cents(result.duration_seconds, result.model_id);

    log_info("Transcribed %s: %.1fs of audio, %zu chars, %d cent(s)",
             path.filename().c_str(), result.duration_seconds, result.text.size(),
             result.cost_cents);

    post_process(options, result);

    result.processing_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    return result;
}

} // namespace recscribe
