// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace recscribe {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Exceptions
// ---------------------------------------------------------------------------

class RecscribeError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Every failure that can leave a pipeline component maps to exactly one kind.
enum class ErrorKind {
    NoApiKey,
    InvalidApiKey,
    QuotaExceeded,
    FileNotFound,
    FileTooLarge,
    NoAudioTrack,
    UnreadableAudio,
    CompressionFailed,
    ExportFailed,
    Timeout,
    NetworkError,
    ServerError,
    NoProviderConfigured,
    UnknownModel,
    Cancelled,
    AlreadyInProgress,
    InvalidState,
};

/// Stable identifier for an error kind ("invalid_api_key", "timeout", ...).
const char* error_kind_name(ErrorKind kind);

class PipelineError : public RecscribeError {
public:
    PipelineError(ErrorKind kind, const std::string& message, int http_status = 0)
        : RecscribeError(message), kind_(kind), http_status_(http_status) {}

    ErrorKind kind() const { return kind_; }

    /// HTTP status for ServerError / InvalidApiKey / QuotaExceeded, else 0.
    int http_status() const { return http_status_; }

private:
    ErrorKind kind_;
    int http_status_;
};

// ---------------------------------------------------------------------------
// Stop token: shared between the CLI signal handler and in-flight uploads
// ---------------------------------------------------------------------------

struct StopToken {
    std::atomic<bool> requested{false};

    void request() { requested.store(true, std::memory_order_release); }
    bool stop_requested() const { return requested.load(std::memory_order_acquire); }
    void reset() { requested.store(false, std::memory_order_release); }
};

// ---------------------------------------------------------------------------
// Path helpers (XDG-compliant)
// ---------------------------------------------------------------------------

/// ~/.config/recscribe/
fs::path config_dir();

/// ~/.local/share/recscribe/
fs::path data_dir();

/// Lowercased extension without the dot ("wav", "mp3"). Empty if none.
std::string lower_extension(const fs::path& path);

/// Sibling path with a suffix inserted before the extension:
/// /a/meeting.wav + "_cropped" -> /a/meeting_cropped.wav
fs::path sibling_with_suffix(const fs::path& path, const std::string& suffix,
                             const std::string& new_ext = "");

// ---------------------------------------------------------------------------
// Text helpers
// ---------------------------------------------------------------------------

/// Strip leading/trailing whitespace (space, tab, CR, LF).
std::string trim(const std::string& s);

/// Write text content to a file, throwing RecscribeError on failure.
void write_text_file(const fs::path& path, const std::string& content);

/// Read entire file as string. Returns empty if missing or unreadable.
std::string read_text_file(const fs::path& path);

} // namespace recscribe
