// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "silence_cropper.h"
#include "audio_file.h"
#include "log.h"

#include <algorithm>
#include <cmath>
#include <system_error>

namespace recscribe {

namespace {

constexpr int64_t COPY_CHUNK_FRAMES = 65536;

void remove_partial(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec)
        log_warn("Could not remove partial output %s: %s", path.c_str(), ec.message().c_str());
}

void splice_ranges(AudioReader& reader, const fs::path& output,
                   const std::vector<KeepRange>& ranges, const StopToken* stop) {
    const AudioInfo& info = reader.info();
    AudioWriter writer(output, info.format, info.sample_rate, info.channels);

    reader.set_normalized(false);
    writer.set_normalized(false);

    std::vector<double> buf(static_cast<size_t>(COPY_CHUNK_FRAMES) * info.channels);

    for (const auto& r : ranges) {
        int64_t first = std::llround(r.start * info.sample_rate);
        int64_t last = std::llround(r.end() * info.sample_rate);
        first = std::clamp<int64_t>(first, 0, info.frames);
        last = std::clamp<int64_t>(last, first, info.frames);
        if (last == first) continue;

        reader.seek(first);
        int64_t remaining = last - first;
        while (remaining > 0) {
            if (stop && stop->stop_requested())
                throw PipelineError(ErrorKind::ExportFailed, "Silence cropping cancelled");

            int64_t want = std::min(remaining, COPY_CHUNK_FRAMES);
            int64_t got = reader.read(buf.data(), want);
            if (got != want)
                throw PipelineError(ErrorKind::ExportFailed,
                                    "Short read at frame " + std::to_string(last - remaining) +
                                    " of " + reader.path().string());
            writer.write(buf.data(), got);
            remaining -= got;
        }
    }
    writer.close();
}

} // anonymous namespace

std::vector<KeepRange> compute_keep_ranges(double total_duration,
                                           const std::vector<SilenceRegion>& silences,
                                           double keep_pad) {
    std::vector<KeepRange> ranges;
    if (total_duration <= 0) return ranges;

    auto emit = [&](double start, double end) {
        start = std::clamp(start, 0.0, total_duration);
        end = std::clamp(end, 0.0, total_duration);
        if (end > start)
            ranges.push_back({start, end - start});
    };

    double cursor = 0.0;
    for (const auto& s : silences) {
        // Half the pad on each side, never more than half the silence, so
        // neighbouring ranges cannot overlap.
        double half = std::min(keep_pad, s.duration()) / 2.0;
        double end_of_good = s.start + half;
        if (end_of_good > cursor)
            emit(cursor, end_of_good);
        cursor = std::max(s.end - half, 0.0);
    }
    if (cursor < total_duration)
        emit(cursor, total_duration);

    return ranges;
}

CropResult crop_silences(const fs::path& path, double min_silence_duration,
                         double keep_pad, double threshold_db,
                         const StopToken* stop) {
    auto silences = detect_silences(path, threshold_db, min_silence_duration);

    AudioReader reader(path);
    CropResult result;
    result.original_duration = reader.info().duration();

    if (silences.empty()) {
        result.output_path = path;
        result.new_duration = result.original_duration;
        log_info("No silences >= %.1fs in %s, nothing to crop",
                 min_silence_duration, path.filename().c_str());
        return result;
    }

    auto ranges = compute_keep_ranges(result.original_duration, silences, keep_pad);
    if (ranges.empty())
        throw PipelineError(ErrorKind::ExportFailed,
                            "No audio would remain after cropping " + path.string());

    fs::path output = sibling_with_suffix(path, "_cropped");
    remove_partial(output);

    try {
        splice_ranges(reader, output, ranges, stop);
    } catch (const RecscribeError&) {
        remove_partial(output);
        throw;
    }

    double kept = 0.0;
    for (const auto& r : ranges) kept += r.duration;

    result.output_path = output;
    result.new_duration = kept;
    result.regions_cropped = static_cast<int>(silences.size());
    result.time_saved = result.original_duration - kept;

    log_info("Cropped %d silence(s) from %s: %.1fs -> %.1fs (saved %.1fs)",
             result.regions_cropped, path.filename().c_str(),
             result.original_duration, result.new_duration, result.time_saved);
    return result;
}

} // namespace recscribe
