// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "http_client.h"
#include "provider.h"
#include "secret_store.h"
#include "transcript.h"
#include "util.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace recscribe {

enum class ResponseFormat { VerboseJson, Text };

/// "verbose_json" / "text"
const char* response_format_name(ResponseFormat format);

struct UploadOptions {
    std::string language;         // empty = let the provider detect
    int timeout_seconds = 0;      // 0 = upload_timeout_for(file size)
    const StopToken* stop = nullptr;
};

struct RawProviderResponse {
    long http_status = 0;
    std::string body;
    ResponseFormat format = ResponseFormat::VerboseJson;
};

/// Decoded verbose_json body.
struct VerboseTranscription {
    std::string text;
    std::optional<double> duration;
    std::optional<std::string> language;
    std::vector<TranscriptSegment> segments;
};

/// OpenAI-compatible chat completion request.
struct ChatRequest {
    std::string model;  // empty = provider's chat model
    std::string system_prompt;
    std::string user_prompt;
    int max_tokens = 1024;
    double temperature = 0.3;
    bool json_mode = false;
    long timeout_seconds = 60;
};

struct ChatReply {
    std::string content;
    int prompt_tokens = 0;
    int completion_tokens = 0;
};

/// MIME type of the upload's file part, chosen by extension.
std::string content_type_for(const fs::path& path);

/// max(180, min(120 + sizeMB * 30, 900)) seconds.
int upload_timeout_for(int64_t size_bytes);

/// Decode a verbose_json body. Throws PipelineError(ServerError) carrying
/// `http_status` if it is not JSON or lacks "text".
VerboseTranscription parse_verbose_response(const std::string& body, long http_status = 200);

// ---------------------------------------------------------------------------
// TranscriptionClient: one provider round-trip per call, no retries
// ---------------------------------------------------------------------------

class TranscriptionClient {
public:
    explicit TranscriptionClient(const SecretStore& secrets,
                                 HttpTransport transport = curl_transport);

    /// POST <base_url>/audio/transcriptions. The size limit is enforced
    /// before any request is made. Non-2xx responses are classified and
    /// thrown; a returned response always has a 2xx status.
    RawProviderResponse upload(const fs::path& path, Provider provider,
                               const std::string& model_id, ResponseFormat format,
                               const UploadOptions& options = {}) const;

    /// Low-latency path for short clips: provider default model, plain text,
    /// English hint, 30 s timeout.
    DictationResult transcribe_dictation(const fs::path& path,
                                         Provider provider = Provider::OpenAI,
                                         const StopToken* stop = nullptr) const;

    /// GET <base_url>/models. True only for HTTP 200.
    bool validate_api_key(Provider provider) const;

    /// POST <base_url>/chat/completions and return the first choice's content.
    ChatReply chat_completion(Provider provider, const ChatRequest& request) const;

    /// Throws PipelineError: NoProviderConfigured, NoApiKey.
    const ProviderInfo& provider_info(Provider provider) const;
    std::string api_key(Provider provider) const;

private:
    const SecretStore& secrets_;
    HttpTransport transport_;
};

} // namespace recscribe
