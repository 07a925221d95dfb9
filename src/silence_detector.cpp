// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "silence_detector.h"
#include "audio_file.h"
#include "log.h"

#include <algorithm>
#include <cmath>

namespace recscribe {

namespace {

int window_frames_for(int sample_rate) {
    int frames = static_cast<int>(std::lround(SILENCE_WINDOW_SECONDS * sample_rate));
    return std::max(frames, 1);
}

// Incremental scanner fed one window at a time. Both overloads drive it so
// the file path and the in-memory path agree window for window.
class SilenceScanner {
public:
    SilenceScanner(int sample_rate, double threshold_db, double min_duration)
        : sample_rate_(sample_rate),
          threshold_(db_to_linear(threshold_db)),
          min_duration_(min_duration) {}

    void feed(const float* window, int64_t frames, int channels) {
        size_t count = static_cast<size_t>(frames) * channels;
        double sum = 0.0;
        for (size_t i = 0; i < count; ++i)
            sum += static_cast<double>(window[i]) * window[i];
        double rms = count > 0 ? std::sqrt(sum / count) : 0.0;

        double t = static_cast<double>(position_) / sample_rate_;
        if (rms < threshold_) {
            if (!open_) {
                open_ = true;
                open_start_ = t;
            }
        } else if (open_) {
            close_at(t);
        }
        position_ += frames;
    }

    std::vector<SilenceRegion> finish(int64_t total_frames) {
        if (open_)
            close_at(static_cast<double>(total_frames) / sample_rate_);
        return std::move(regions_);
    }

private:
    void close_at(double t) {
        open_ = false;
        if (t - open_start_ >= min_duration_)
            regions_.push_back({open_start_, t});
    }

    int sample_rate_;
    double threshold_;
    double min_duration_;
    int64_t position_ = 0;
    bool open_ = false;
    double open_start_ = 0.0;
    std::vector<SilenceRegion> regions_;
};

} // anonymous namespace

double db_to_linear(double db) {
    return std::pow(10.0, db / 20.0);
}

std::vector<SilenceRegion> detect_silences(const std::vector<float>& samples,
                                           int channels, int sample_rate,
                                           double threshold_db,
                                           double min_duration) {
    if (channels <= 0 || sample_rate <= 0 || samples.empty())
        return {};

    int64_t total_frames = static_cast<int64_t>(samples.size()) / channels;
    int64_t window = window_frames_for(sample_rate);

    SilenceScanner scanner(sample_rate, threshold_db, min_duration);
    for (int64_t pos = 0; pos < total_frames; pos += window) {
        int64_t n = std::min(window, total_frames - pos);
        scanner.feed(samples.data() + pos * channels, n, channels);
    }
    return scanner.finish(total_frames);
}

std::vector<SilenceRegion> detect_silences(const fs::path& path,
                                           double threshold_db,
                                           double min_duration) {
    AudioReader reader(path);
    const AudioInfo& info = reader.info();
    int64_t window = window_frames_for(info.sample_rate);

    std::vector<float> buf(static_cast<size_t>(window) * info.channels);
    SilenceScanner scanner(info.sample_rate, threshold_db, min_duration);

    int64_t total = 0;
    for (;;) {
        int64_t n = reader.read(buf.data(), window);
        if (n <= 0) break;
        scanner.feed(buf.data(), n, info.channels);
        total += n;
    }

    // Trailing silence closes at the header's frame count.
    int64_t total_frames = std::max(total, info.frames);
    auto regions = scanner.finish(total_frames);

    log_info("Silence scan: %s, %.1fs, %zu region(s) >= %.1fs below %.0f dB",
             path.filename().c_str(), info.duration(), regions.size(),
             min_duration, threshold_db);
    return regions;
}

} // namespace recscribe
