// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "provider.h"
#include "util.h"

#include <algorithm>
#include <cmath>

namespace recscribe {

constexpr int64_t MIB = 1024 * 1024;

const ProviderInfo PROVIDERS[] = {
    {Provider::OpenAI, "openai", "OpenAI", "https://api.openai.com/v1",
     "OPENAI_API_KEY", "whisper-1", "gpt-4o-mini", 25 * MIB},
    {Provider::Groq, "groq", "Groq", "https://api.groq.com/openai/v1",
     "GROQ_API_KEY", "whisper-large-v3-turbo", "llama-3.1-8b-instant", 25 * MIB},
};

const size_t NUM_PROVIDERS = sizeof(PROVIDERS) / sizeof(PROVIDERS[0]);

const ProviderInfo* find_provider(const std::string& name) {
    for (size_t i = 0; i < NUM_PROVIDERS; ++i)
        if (name == PROVIDERS[i].name)
            return &PROVIDERS[i];
    return nullptr;
}

const ProviderInfo* find_provider(Provider id) {
    for (size_t i = 0; i < NUM_PROVIDERS; ++i)
        if (PROVIDERS[i].id == id)
            return &PROVIDERS[i];
    return nullptr;
}

Provider parse_provider(const std::string& name) {
    const auto* p = find_provider(name);
    return p ? p->id : Provider::None;
}

std::string format_file_size_limit(const ProviderInfo& provider) {
    if (provider.max_file_size >= 1024 * MIB)
        return std::to_string(provider.max_file_size / (1024 * MIB)) + "GB";
    return std::to_string(provider.max_file_size / MIB) + "MB";
}

const ModelRate MODEL_RATES[] = {
    {"whisper-1",                  0.6},
    {"gpt-4o-transcribe",          0.6},
    {"gpt-4o-mini-transcribe",     0.3},
    {"whisper-large-v3",           0.185},
    {"whisper-large-v3-turbo",     0.0667},
    {"distil-whisper-large-v3-en", 0.0333},
};

const size_t NUM_MODEL_RATES = sizeof(MODEL_RATES) / sizeof(MODEL_RATES[0]);

double rate_per_minute_cents(const std::string& model_id) {
    for (size_t i = 0; i < NUM_MODEL_RATES; ++i)
        if (model_id == MODEL_RATES[i].model_id)
            return MODEL_RATES[i].cents_per_minute;
    throw PipelineError(ErrorKind::UnknownModel,
                        "No rate known for transcription model '" + model_id + "'");
}

int compute_cost_cents(double duration_seconds, const std::string& model_id) {
    double rate = rate_per_minute_cents(model_id);
    if (!(duration_seconds > 0.0)) return 0;
    double raw = (duration_seconds / 60.0) * rate;
    // Epsilon absorbs binary rounding (10 min * 0.3 = 3.0000000000000004);
    // any billable audio costs at least a cent.
    double cents = std::max(1.0, std::ceil(raw - 1e-9));
    return raw > 0.0 ? static_cast<int>(cents) : 0;
}

double estimate_duration_seconds(int64_t file_size_bytes) {
    constexpr double BYTES_PER_SECOND = 8000.0;  // 64 kbps
    return file_size_bytes > 0 ? static_cast<double>(file_size_bytes) / BYTES_PER_SECOND : 0.0;
}

} // namespace recscribe
