// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "util.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace recscribe {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NoApiKey:             return "no_api_key";
        case ErrorKind::InvalidApiKey:        return "invalid_api_key";
        case ErrorKind::QuotaExceeded:        return "quota_exceeded";
        case ErrorKind::FileNotFound:         return "file_not_found";
        case ErrorKind::FileTooLarge:         return "file_too_large";
        case ErrorKind::NoAudioTrack:         return "no_audio_track";
        case ErrorKind::UnreadableAudio:      return "unreadable_audio";
        case ErrorKind::CompressionFailed:    return "compression_failed";
        case ErrorKind::ExportFailed:         return "export_failed";
        case ErrorKind::Timeout:              return "timeout";
        case ErrorKind::NetworkError:         return "network_error";
        case ErrorKind::ServerError:          return "server_error";
        case ErrorKind::NoProviderConfigured: return "no_provider_configured";
        case ErrorKind::UnknownModel:         return "unknown_model";
        case ErrorKind::Cancelled:            return "cancelled";
        case ErrorKind::AlreadyInProgress:    return "already_in_progress";
        case ErrorKind::InvalidState:         return "invalid_state";
    }
    return "unknown";
}

static fs::path xdg_dir(const char* env_var, const char* fallback_suffix) {
    if (const char* val = std::getenv(env_var); val && val[0] != '\0')
        return fs::path(val) / "recscribe";
    if (const char* home = std::getenv("HOME"))
        return fs::path(home) / fallback_suffix / "recscribe";
    return fs::path(".") / fallback_suffix / "recscribe";
}

fs::path config_dir() { return xdg_dir("XDG_CONFIG_HOME", ".config"); }
fs::path data_dir()   { return xdg_dir("XDG_DATA_HOME", ".local/share"); }

std::string lower_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

fs::path sibling_with_suffix(const fs::path& path, const std::string& suffix,
                             const std::string& new_ext) {
    std::string name = path.stem().string() + suffix;
    if (!new_ext.empty())
        name += "." + new_ext;
    else
        name += path.extension().string();
    return path.parent_path() / name;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void write_text_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    if (!out)
        throw RecscribeError("Cannot write file: " + path.string());
    out << content;
    if (!out)
        throw RecscribeError("Write failed: " + path.string());
}

std::string read_text_file(const fs::path& path) {
    if (path.empty() || !fs::exists(path)) return "";
    std::ifstream in(path);
    if (!in) return "";
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

} // namespace recscribe
