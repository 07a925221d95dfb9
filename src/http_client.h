// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "util.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace recscribe {

/// One part of a multipart/form-data body. A non-empty `file` streams the
/// file's contents; otherwise `value` is sent as a plain text field.
struct FormPart {
    std::string name;
    std::string value;
    fs::path file;
    std::string filename;
    std::string content_type;
};

struct HttpRequest {
    std::string method = "GET";  // "GET" or "POST"
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;             // raw body for JSON POSTs
    std::vector<FormPart> form;   // non-empty selects multipart/form-data
    long timeout_seconds = 60;
    const StopToken* stop = nullptr;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

/// Executes a request. Non-2xx statuses are returned, not thrown; only
/// transport failures throw.
using HttpTransport = std::function<HttpResponse(const HttpRequest&)>;

/// libcurl transport. Throws PipelineError: Timeout when the deadline
/// expires, Cancelled when the stop token fires, NetworkError otherwise.
HttpResponse curl_transport(const HttpRequest& request);

/// Convenience builders used by the API clients.
HttpRequest make_get(const std::string& url, const std::string& bearer, long timeout_seconds);
HttpRequest make_post_json(const std::string& url, const std::string& bearer,
                           const std::string& json_body, long timeout_seconds);

} // namespace recscribe
