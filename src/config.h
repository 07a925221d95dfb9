// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"
#include "transcript.h"

#include <map>
#include <string>

namespace recscribe {

struct Config {
    // Transcription
    std::string provider = "openai";
    std::string model;     // empty = provider default
    std::string language;  // empty = auto-detect, otherwise ISO 639-1 code (e.g. "en")
    int upload_timeout = 0;  // seconds, 0 = derived from file size

    // Silence cropping
    bool crop_silences = false;
    double silence_crop_threshold = 3.0;  // minimum silence (seconds) worth cutting
    double silence_threshold_db = -40.0;
    double keep_pad = 1.0;                 // seconds of silence kept at each cut

    // Post-processing
    bool auto_compress = true;
    bool diarize = true;
    bool identify_speakers = true;
    bool generate_title = true;

    // Config-file API keys, by provider name. Environment variables win.
    std::map<std::string, std::string> api_keys;

    // Bulk retry
    int retry_delay_ms = 500;

    // Logging
    std::string log_level_str;  // "none", "error", "warn", "info", "debug" (default: "none")
    fs::path log_dir;            // empty = default (~/.local/share/recscribe/logs/)

    /// Options bag for the orchestrator. Unknown provider names map to Provider::None.
    TranscriptionOptions transcription_options() const;
};

/// Load config. Uses path if provided, otherwise ~/.config/recscribe/config.yaml.
Config load_config(const fs::path& config_path = {});

/// Save config. Uses path if provided, otherwise ~/.config/recscribe/config.yaml.
void save_config(const Config& cfg, const fs::path& config_path = {});

} // namespace recscribe
