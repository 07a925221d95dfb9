// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "config.h"

#include <vector>

namespace recscribe {

enum class CliMode { Transcribe, Dictate, DetectSilences, CropOnly };

struct CliResult {
    Config cfg;
    fs::path config_path;         // empty = default location
    std::vector<fs::path> files;
    CliMode mode = CliMode::Transcribe;
    bool retry_failed = false;
    bool show_help = false;
    bool show_version = false;
    std::string error;            // set on a bad flag value
};

/// Parse command-line arguments. Loads the config file (--config or the
/// default path) as defaults, then applies flag overrides.
CliResult parse_cli(int argc, char* argv[]);

/// <dir>/<stem>.transcript.txt beside the audio file.
fs::path transcript_path_for(const fs::path& audio);

} // namespace recscribe
