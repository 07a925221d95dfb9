// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "transcription_client.h"
#include "audio_file.h"
#include "error_classify.h"
#include "log.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>

namespace recscribe {

using json = nlohmann::json;

namespace {

constexpr int DICTATION_TIMEOUT_SECONDS = 30;
constexpr long VALIDATE_TIMEOUT_SECONDS = 15;

bool is_success(long status) { return status >= 200 && status < 300; }

} // anonymous namespace

const char* response_format_name(ResponseFormat format) {
    switch (format) {
        case ResponseFormat::VerboseJson: return "verbose_json";
        case ResponseFormat::Text:        return "text";
    }
    return "verbose_json";
}

std::string content_type_for(const fs::path& path) {
    std::string ext = lower_extension(path);
    if (ext == "wav") return "audio/wav";
    if (ext == "mp3") return "audio/mpeg";
    if (ext == "ogg") return "audio/ogg";
    if (ext == "flac") return "audio/flac";
    return "audio/m4a";
}

int upload_timeout_for(int64_t size_bytes) {
    double size_mb = static_cast<double>(size_bytes) / (1024.0 * 1024.0);
    double t = std::max(180.0, std::min(120.0 + size_mb * 30.0, 900.0));
    return static_cast<int>(t);
}

VerboseTranscription parse_verbose_response(const std::string& body, long http_status) {
    int code = static_cast<int>(http_status);
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw PipelineError(ErrorKind::ServerError,
                            "Invalid response from transcription service (not JSON)", code);

    auto text = j.find("text");
    if (text == j.end() || !text->is_string())
        throw PipelineError(ErrorKind::ServerError,
                            "Invalid response from transcription service (missing text)", code);

    VerboseTranscription out;
    out.text = trim(text->get<std::string>());

    if (auto d = j.find("duration"); d != j.end() && d->is_number())
        out.duration = d->get<double>();
    if (auto l = j.find("language"); l != j.end() && l->is_string())
        out.language = l->get<std::string>();

    if (auto segs = j.find("segments"); segs != j.end() && segs->is_array()) {
        for (const auto& s : *segs) {
            if (!s.is_object()) continue;
            TranscriptSegment seg;
            seg.start = s.value("start", 0.0);
            seg.end = s.value("end", seg.start);
            seg.text = trim(s.value("text", std::string()));
            if (auto sp = s.find("speaker"); sp != s.end() && sp->is_string())
                seg.speaker = sp->get<std::string>();
            out.segments.push_back(std::move(seg));
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// TranscriptionClient
// ---------------------------------------------------------------------------

TranscriptionClient::TranscriptionClient(const SecretStore& secrets, HttpTransport transport)
    : secrets_(secrets), transport_(std::move(transport)) {}

const ProviderInfo& TranscriptionClient::provider_info(Provider provider) const {
    const auto* info = find_provider(provider);
    if (!info)
        throw PipelineError(ErrorKind::NoProviderConfigured,
                            "No transcription provider configured");
    return *info;
}

std::string TranscriptionClient::api_key(Provider provider) const {
    const auto& info = provider_info(provider);
    auto key = secrets_.read_key(provider);
    if (!key)
        throw PipelineError(ErrorKind::NoApiKey,
                            std::string("No API key configured for ") + info.display +
                            " (set " + info.env_var + ")");
    return *key;
}

RawProviderResponse TranscriptionClient::upload(const fs::path& path, Provider provider,
                                                const std::string& model_id,
                                                ResponseFormat format,
                                                const UploadOptions& options) const {
    const auto& info = provider_info(provider);
    std::string key = api_key(provider);

    int64_t size = file_size_bytes(path);
    if (size < 0)
        throw PipelineError(ErrorKind::FileNotFound, "Audio file not found: " + path.string());
    if (size > info.max_file_size)
        throw PipelineError(ErrorKind::FileTooLarge,
                            "File is " + std::to_string(size / (1024 * 1024)) + "MB; " +
                            info.display + " accepts at most " + format_file_size_limit(info));

    std::string model = model_id.empty() ? info.default_model : model_id;
    std::string ext = lower_extension(path);

    HttpRequest req;
    req.method = "POST";
    req.url = std::string(info.base_url) + "/audio/transcriptions";
    req.headers["Authorization"] = "Bearer " + key;
    req.timeout_seconds = options.timeout_seconds > 0 ? options.timeout_seconds
                                                      : upload_timeout_for(size);
    req.stop = options.stop;

    FormPart file_part;
    file_part.name = "file";
    file_part.file = path;
    file_part.filename = "audio." + (ext.empty() ? std::string("m4a") : ext);
    file_part.content_type = content_type_for(path);
    req.form.push_back(std::move(file_part));
    req.form.push_back({"model", model, {}, {}, {}});
    req.form.push_back({"response_format", response_format_name(format), {}, {}, {}});
    if (!options.language.empty())
        req.form.push_back({"language", options.language, {}, {}, {}});

    log_info("Uploading %s (%lld bytes) to %s, model %s, timeout %lds",
             path.filename().c_str(), (long long)size, info.display, model.c_str(),
             req.timeout_seconds);

    HttpResponse resp = transport_(req);
    if (!is_success(resp.status)) {
        PipelineError err = classify_http_error(resp.status, resp.body, &info);
        log_error("Transcription failed (%s, HTTP %ld): %s",
                  error_kind_name(err.kind()), resp.status, err.what());
        throw err;
    }

    return {resp.status, std::move(resp.body), format};
}

DictationResult TranscriptionClient::transcribe_dictation(const fs::path& path,
                                                          Provider provider,
                                                          const StopToken* stop) const {
    const auto& info = provider_info(provider);
    auto started = std::chrono::steady_clock::now();

    UploadOptions opts;
    opts.language = "en";
    opts.timeout_seconds = DICTATION_TIMEOUT_SECONDS;
    opts.stop = stop;

    auto raw = upload(path, provider, info.default_model, ResponseFormat::Text, opts);

    DictationResult result;
    result.text = trim(raw.body);
    result.latency_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();

    double duration = audio_duration_seconds(path);
    if (duration <= 0)
        duration = estimate_duration_seconds(file_size_bytes(path));
    result.cost_cents = compute_cost_cents(duration, info.default_model);

    log_info("Dictation: %zu chars in %.2fs, %d cent(s)",
             result.text.size(), result.latency_seconds, result.cost_cents);
    return result;
}

bool TranscriptionClient::validate_api_key(Provider provider) const {
    try {
        const auto& info = provider_info(provider);
        std::string key = api_key(provider);
        auto resp = transport_(make_get(std::string(info.base_url) + "/models", key,
                                        VALIDATE_TIMEOUT_SECONDS));
        return resp.status == 200;
    } catch (const PipelineError& e) {
        log_warn("API key validation failed: %s", e.what());
        return false;
    }
}

ChatReply TranscriptionClient::chat_completion(Provider provider, const ChatRequest& request) const {
    const auto& info = provider_info(provider);
    std::string key = api_key(provider);

    json body = {
        {"model", request.model.empty() ? std::string(info.chat_model) : request.model},
        {"messages", json::array({
            {{"role", "system"}, {"content", request.system_prompt}},
            {{"role", "user"}, {"content", request.user_prompt}},
        })},
        {"max_tokens", request.max_tokens},
        {"temperature", request.temperature},
    };
    if (request.json_mode)
        body["response_format"] = {{"type", "json_object"}};

    auto resp = transport_(make_post_json(std::string(info.base_url) + "/chat/completions",
                                          key, body.dump(), request.timeout_seconds));
    if (!is_success(resp.status))
        throw classify_http_error(resp.status, resp.body, &info);

    json j = json::parse(resp.body, nullptr, false);
    int code = static_cast<int>(resp.status);
    if (j.is_discarded() || !j.is_object())
        throw PipelineError(ErrorKind::ServerError, "Invalid chat completion response", code);

    auto choices = j.find("choices");
    if (choices == j.end() || !choices->is_array() || choices->empty())
        throw PipelineError(ErrorKind::ServerError, "Chat completion returned no choices", code);

    const auto& message = (*choices)[0].value("message", json::object());
    auto content = message.find("content");
    if (content == message.end() || !content->is_string())
        throw PipelineError(ErrorKind::ServerError, "Chat completion has no content", code);

    ChatReply reply;
    reply.content = content->get<std::string>();
    if (auto usage = j.find("usage"); usage != j.end() && usage->is_object()) {
        reply.prompt_tokens = usage->value("prompt_tokens", 0);
        reply.completion_tokens = usage->value("completion_tokens", 0);
    }
    return reply;
}

} // namespace recscribe
