// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace recscribe {

enum class Provider { None, OpenAI, Groq };

struct ProviderInfo {
    Provider id;
    const char* name;          // "openai", "groq"
    const char* display;       // "OpenAI", "Groq"
    const char* base_url;      // "https://api.openai.com/v1"
    const char* env_var;       // "OPENAI_API_KEY"
    const char* default_model; // "whisper-1"
    const char* chat_model;    // model used for titles / diarization / speaker naming
    int64_t max_file_size;     // upload limit in bytes
};

extern const ProviderInfo PROVIDERS[];
extern const size_t NUM_PROVIDERS;

const ProviderInfo* find_provider(const std::string& name);
const ProviderInfo* find_provider(Provider id);

/// "openai" -> Provider::OpenAI. Unknown or empty names yield Provider::None.
Provider parse_provider(const std::string& name);

/// Human-readable provider limit, e.g. "25MB".
std::string format_file_size_limit(const ProviderInfo& provider);

// ---------------------------------------------------------------------------
// Rate table
// ---------------------------------------------------------------------------

struct ModelRate {
    const char* model_id;
    double cents_per_minute;
};

extern const ModelRate MODEL_RATES[];
extern const size_t NUM_MODEL_RATES;

/// Per-minute rate in cents. Throws PipelineError(UnknownModel) for models
/// missing from the table.
double rate_per_minute_cents(const std::string& model_id);

/// ceil(duration_minutes * rate). Never negative, never under-reported.
int compute_cost_cents(double duration_seconds, const std::string& model_id);

/// Estimated seconds of compressed speech audio from a file size
/// (~64 kbps, 8000 bytes per second). Used when the provider omits duration.
double estimate_duration_seconds(int64_t file_size_bytes);

} // namespace recscribe
