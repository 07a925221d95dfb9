// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "provider.h"
#include "util.h"

#include <string>

namespace recscribe {

/// `error.message` from an OpenAI-style error body, or "" if absent or the
/// body is not JSON.
std::string extract_provider_message(const std::string& body);

/// Best-effort text heuristic: does the body mention quota, rate limits or
/// billing? Case-insensitive.
bool looks_like_quota_error(const std::string& body);

/// Map a non-2xx response to the error the caller should throw.
///   401 -> InvalidApiKey, 429 -> QuotaExceeded (body ignored)
///   other 4xx with a quota-looking body -> QuotaExceeded
///   anything else -> ServerError
/// The message is the provider's own when the body carries one.
PipelineError classify_http_error(long status, const std::string& body,
                                  const ProviderInfo* provider = nullptr);

} // namespace recscribe
