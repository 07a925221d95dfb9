// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "config.h"
#include "log.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace recscribe {

namespace {

// Simple YAML parser: handles flat key: value and one level of nesting.
// Good enough for our config file; no need for a full YAML library.

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                           (s.front() == '\'' && s.back() == '\'')))
        return s.substr(1, s.size() - 2);
    return s;
}

struct YamlEntry {
    std::string key;
    std::string value;
    int indent;
};

std::vector<YamlEntry> parse_yaml(const std::string& text) {
    std::vector<YamlEntry> entries;
    std::istringstream stream(text);
    std::string line;

    while (std::getline(stream, line)) {
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        int indent = 0;
        while (indent < (int)line.size() && line[indent] == ' ') indent++;

        auto colon = trimmed.find(':');
        if (colon == std::string::npos) continue;

        std::string key = trim(trimmed.substr(0, colon));
        std::string val = trim(trimmed.substr(colon + 1));
        entries.push_back({key, unquote(val), indent});
    }
    return entries;
}

// Walks entries and reports whether each one sits inside `section`.
template <typename Fn>
void for_section(const std::vector<YamlEntry>& entries, const std::string& section, Fn fn) {
    bool in_section = false;
    for (const auto& e : entries) {
        if (e.indent == 0) {
            in_section = (e.key == section && e.value.empty());
            continue;
        }
        if (in_section) fn(e);
    }
}

std::string get_val(const std::vector<YamlEntry>& entries,
                    const std::string& section, const std::string& key,
                    const std::string& def = "") {
    std::string result = def;
    for_section(entries, section, [&](const YamlEntry& e) {
        if (e.key == key) result = e.value;
    });
    return result;
}

bool get_bool(const std::vector<YamlEntry>& entries,
              const std::string& section, const std::string& key,
              bool def = false) {
    std::string val = get_val(entries, section, key, def ? "true" : "false");
    return val == "true" || val == "yes" || val == "1";
}

double get_double(const std::vector<YamlEntry>& entries,
                  const std::string& section, const std::string& key, double def) {
    std::string val = get_val(entries, section, key, "");
    if (val.empty()) return def;
    char* end = nullptr;
    double d = std::strtod(val.c_str(), &end);
    if (end == val.c_str()) {
        log_warn("config: %s.%s is not a number (\"%s\"), using default",
                 section.c_str(), key.c_str(), val.c_str());
        return def;
    }
    return d;
}

int get_int(const std::vector<YamlEntry>& entries,
            const std::string& section, const std::string& key, int def) {
    return static_cast<int>(get_double(entries, section, key, def));
}

fs::path default_config_path() {
    return config_dir() / "config.yaml";
}

} // anonymous namespace

TranscriptionOptions Config::transcription_options() const {
    TranscriptionOptions opts;
    opts.provider = parse_provider(provider);
    opts.model_id = model;
    opts.language = language;
    opts.crop_silences = crop_silences;
    opts.silence_crop_threshold_seconds = silence_crop_threshold;
    opts.silence_threshold_db = silence_threshold_db;
    opts.keep_pad_seconds = keep_pad;
    opts.auto_compress = auto_compress;
    opts.enable_diarization = diarize;
    opts.identify_speakers = identify_speakers;
    opts.generate_title = generate_title;
    opts.upload_timeout_seconds = upload_timeout;
    return opts;
}

Config load_config(const fs::path& config_path) {
    Config cfg;
    fs::path path = config_path.empty() ? default_config_path() : config_path;

    if (!fs::exists(path))
        return cfg;

    std::ifstream in(path);
    if (!in) {
        log_warn("config: cannot read %s, using defaults", path.c_str());
        return cfg;
    }

    std::ostringstream buf;
    buf << in.rdbuf();
    auto entries = parse_yaml(buf.str());

    // Transcription section
    cfg.provider = get_val(entries, "transcription", "provider", cfg.provider);
    cfg.model = get_val(entries, "transcription", "model", cfg.model);
    cfg.language = get_val(entries, "transcription", "language", "");
    cfg.upload_timeout = get_int(entries, "transcription", "upload_timeout", cfg.upload_timeout);
    cfg.crop_silences = get_bool(entries, "transcription", "crop_silences", cfg.crop_silences);
    cfg.silence_crop_threshold = get_double(entries, "transcription", "silence_crop_threshold",
                                            cfg.silence_crop_threshold);
    cfg.silence_threshold_db = get_double(entries, "transcription", "silence_threshold_db",
                                          cfg.silence_threshold_db);
    cfg.keep_pad = get_double(entries, "transcription", "keep_pad", cfg.keep_pad);
    cfg.auto_compress = get_bool(entries, "transcription", "auto_compress", cfg.auto_compress);
    cfg.diarize = get_bool(entries, "transcription", "diarization", cfg.diarize);
    cfg.identify_speakers = get_bool(entries, "transcription", "identify_speakers",
                                     cfg.identify_speakers);
    cfg.generate_title = get_bool(entries, "transcription", "generate_title", cfg.generate_title);

    // Keys section: one entry per provider name
    for_section(entries, "keys", [&](const YamlEntry& e) {
        if (!e.value.empty()) cfg.api_keys[e.key] = e.value;
    });

    // Retry section
    cfg.retry_delay_ms = get_int(entries, "retry", "delay_ms", cfg.retry_delay_ms);
    if (cfg.retry_delay_ms < 0) cfg.retry_delay_ms = 0;

    // Logging section
    cfg.log_level_str = get_val(entries, "logging", "level", "");
    std::string dir = get_val(entries, "logging", "directory", "");
    if (!dir.empty()) cfg.log_dir = dir;

    return cfg;
}

void save_config(const Config& cfg, const fs::path& config_path) {
    fs::path path = config_path.empty() ? default_config_path() : config_path;
    if (path.has_parent_path())
        fs::create_directories(path.parent_path());

    std::ofstream out(path);
    if (!out)
        throw RecscribeError("Cannot write config: " + path.string());

    auto yn = [](bool b) { return b ? "true" : "false"; };

    out << "# recscribe configuration\n\n"
        << "transcription:\n"
        << "  provider: " << cfg.provider << "\n";
    if (!cfg.model.empty())
        out << "  model: " << cfg.model << "\n";
    if (!cfg.language.empty())
        out << "  language: " << cfg.language << "\n";
    if (cfg.upload_timeout > 0)
        out << "  upload_timeout: " << cfg.upload_timeout << "\n";
    out << "  crop_silences: " << yn(cfg.crop_silences) << "\n"
        << "  silence_crop_threshold: " << cfg.silence_crop_threshold << "\n"
        << "  silence_threshold_db: " << cfg.silence_threshold_db << "\n"
        << "  keep_pad: " << cfg.keep_pad << "\n"
        << "  auto_compress: " << yn(cfg.auto_compress) << "\n"
        << "  diarization: " << yn(cfg.diarize) << "\n"
        << "  identify_speakers: " << yn(cfg.identify_speakers) << "\n"
        << "  generate_title: " << yn(cfg.generate_title) << "\n";

    if (!cfg.api_keys.empty()) {
        out << "\nkeys:\n";
        for (const auto& [name, key] : cfg.api_keys)
            out << "  " << name << ": \"" << key << "\"\n";
    }

    out << "\nretry:\n"
        << "  delay_ms: " << cfg.retry_delay_ms << "\n";

    if (!cfg.log_level_str.empty() || !cfg.log_dir.empty()) {
        out << "\nlogging:\n";
        if (!cfg.log_level_str.empty())
            out << "  level: " << cfg.log_level_str << "\n";
        if (!cfg.log_dir.empty())
            out << "  directory: \"" << cfg.log_dir.string() << "\"\n";
    }

    if (!out)
        throw RecscribeError("Write failed: " + path.string());
}

} // namespace recscribe
