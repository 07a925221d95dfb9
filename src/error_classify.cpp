// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "error_classify.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace recscribe {

using json = nlohmann::json;

namespace {

const char* QUOTA_MARKERS[] = {"insufficient_quota", "quota", "rate_limit", "billing"};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

std::string extract_provider_message(const std::string& body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return "";

    auto it = j.find("error");
    if (it == j.end())
        return "";
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_object()) {
        auto msg = it->find("message");
        if (msg != it->end() && msg->is_string())
            return msg->get<std::string>();
    }
    return "";
}

bool looks_like_quota_error(const std::string& body) {
    std::string lower = to_lower(body);
    for (const char* marker : QUOTA_MARKERS) {
        if (lower.find(marker) != std::string::npos)
            return true;
    }
    return false;
}

PipelineError classify_http_error(long status, const std::string& body,
                                  const ProviderInfo* provider) {
    std::string provider_msg = extract_provider_message(body);
    std::string display = provider ? provider->display : "the provider";
    int code = static_cast<int>(status);

    if (status == 401) {
        std::string msg = provider_msg.empty()
            ? "Invalid API key. Check your " + display + " API key."
            : provider_msg;
        return PipelineError(ErrorKind::InvalidApiKey, msg, code);
    }

    if (status == 429 || (status >= 400 && status < 500 && looks_like_quota_error(body))) {
        std::string msg = provider_msg.empty()
            ? "API quota exceeded or rate limited by " + display + " (HTTP " +
              std::to_string(status) + ")."
            : provider_msg;
        return PipelineError(ErrorKind::QuotaExceeded, msg, code);
    }

    std::string detail = provider_msg.empty() ? trim(body) : provider_msg;
    if (detail.empty())
        detail = "no response body";
    return PipelineError(ErrorKind::ServerError,
                         "Server error (" + std::to_string(status) + "): " + detail, code);
}

} // namespace recscribe
