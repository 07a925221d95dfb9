// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "cli.h"
#include "provider.h"

#include <getopt.h>

#include <cstdlib>
#include <cstring>

namespace recscribe {

namespace {

// --config must be known before the config file is loaded, so it is found
// ahead of the getopt pass.
fs::path find_config_arg(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--") == 0) break;
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc)
            return argv[i + 1];
        if (std::strncmp(argv[i], "--config=", 9) == 0)
            return argv[i] + 9;
    }
    return {};
}

bool parse_number(const char* s, double& out) {
    char* end = nullptr;
    out = std::strtod(s, &end);
    return end != s && *end == '\0';
}

} // anonymous namespace

fs::path transcript_path_for(const fs::path& audio) {
    return audio.parent_path() / (audio.stem().string() + ".transcript.txt");
}

CliResult parse_cli(int argc, char* argv[]) {
    static const struct option long_opts[] = {
        {"provider",          required_argument, nullptr, 'p'},
        {"model",             required_argument, nullptr, 'm'},
        {"language",          required_argument, nullptr, 'g'},
        {"crop-silences",     no_argument,       nullptr, 'C'},
        {"silence-threshold", required_argument, nullptr, 'T'},
        {"no-diarize",        no_argument,       nullptr, 'D'},
        {"no-title",          no_argument,       nullptr, 'N'},
        {"no-compress",       no_argument,       nullptr, 'Z'},
        {"dictate",           no_argument,       nullptr, 'd'},
        {"detect-silences",   no_argument,       nullptr, 'S'},
        {"crop-only",         no_argument,       nullptr, 'O'},
        {"retry-failed",      no_argument,       nullptr, 'R'},
        {"retry-delay",       required_argument, nullptr, 'y'},
        {"log-level",         required_argument, nullptr, 'L'},
        {"config",            required_argument, nullptr, 'c'},
        {"help",              no_argument,       nullptr, 'h'},
        {"version",           no_argument,       nullptr, 'v'},
        {nullptr, 0, nullptr, 0},
    };

    CliResult result;
    result.config_path = find_config_arg(argc, argv);
    result.cfg = load_config(result.config_path);

    double num = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "hv", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'p':
                if (parse_provider(optarg) == Provider::None) {
                    result.error = std::string("Unknown provider: ") + optarg;
                    return result;
                }
                result.cfg.provider = optarg;
                break;
            case 'm': result.cfg.model = optarg; break;
            case 'g': result.cfg.language = optarg; break;
            case 'C': result.cfg.crop_silences = true; break;
            case 'T':
                if (!parse_number(optarg, num) || num <= 0) {
                    result.error = std::string("Invalid --silence-threshold: ") + optarg;
                    return result;
                }
                result.cfg.silence_crop_threshold = num;
                break;
            case 'D':
                result.cfg.diarize = false;
                result.cfg.identify_speakers = false;
                break;
            case 'N': result.cfg.generate_title = false; break;
            case 'Z': result.cfg.auto_compress = false; break;
            case 'd': result.mode = CliMode::Dictate; break;
            case 'S': result.mode = CliMode::DetectSilences; break;
            case 'O': result.mode = CliMode::CropOnly; break;
            case 'R': result.retry_failed = true; break;
            case 'y':
                if (!parse_number(optarg, num) || num < 0) {
                    result.error = std::string("Invalid --retry-delay: ") + optarg;
                    return result;
                }
                result.cfg.retry_delay_ms = static_cast<int>(num);
                break;
            case 'L': result.cfg.log_level_str = optarg; break;
            case 'c': break;  // handled by find_config_arg
            case 'v': result.show_version = true; return result;
            case 'h': result.show_help = true; return result;
            default:  result.show_help = true; return result;
        }
    }

    for (int i = optind; i < argc; ++i)
        result.files.emplace_back(argv[i]);

    return result;
}

} // namespace recscribe
