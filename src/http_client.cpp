// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "http_client.h"
#include "log.h"
#include "version.h"

#include <curl/curl.h>

namespace recscribe {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* buf = static_cast<std::string*>(userp);
    buf->append(static_cast<char*>(contents), total);
    return total;
}

// Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* stop = static_cast<const StopToken*>(clientp);
    return (stop && stop->stop_requested()) ? 1 : 0;
}

struct CurlInit {
    CurlInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlInit() { curl_global_cleanup(); }
};

CurlInit& ensure_curl() {
    static CurlInit init;
    return init;
}

// Owns every libcurl resource for one request.
struct CurlHandle {
    CURL* curl = nullptr;
    curl_mime* mime = nullptr;
    curl_slist* headers = nullptr;

    CurlHandle() {
        ensure_curl();
        curl = curl_easy_init();
        if (!curl)
            throw PipelineError(ErrorKind::NetworkError, "curl_easy_init failed");
    }
    ~CurlHandle() {
        if (mime) curl_mime_free(mime);
        if (headers) curl_slist_free_all(headers);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

void build_form(CurlHandle& h, const std::vector<FormPart>& form) {
    h.mime = curl_mime_init(h.curl);
    for (const auto& f : form) {
        curl_mimepart* part = curl_mime_addpart(h.mime);
        curl_mime_name(part, f.name.c_str());
        if (!f.file.empty()) {
            if (curl_mime_filedata(part, f.file.c_str()) != CURLE_OK)
                throw PipelineError(ErrorKind::FileNotFound,
                                    "Cannot attach file: " + f.file.string());
            if (!f.filename.empty())
                curl_mime_filename(part, f.filename.c_str());
        } else {
            curl_mime_data(part, f.value.c_str(), CURL_ZERO_TERMINATED);
        }
        if (!f.content_type.empty())
            curl_mime_type(part, f.content_type.c_str());
    }
    curl_easy_setopt(h.curl, CURLOPT_MIMEPOST, h.mime);
}

} // anonymous namespace

HttpResponse curl_transport(const HttpRequest& request) {
    CurlHandle h;
    HttpResponse response;

    static const std::string ua = std::string("recscribe/") + RECSCRIBE_VERSION;

    curl_easy_setopt(h.curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(h.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(h.curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h.curl, CURLOPT_TIMEOUT, request.timeout_seconds);
    curl_easy_setopt(h.curl, CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(h.curl, CURLOPT_USERAGENT, ua.c_str());

    if (request.stop) {
        curl_easy_setopt(h.curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(h.curl, CURLOPT_XFERINFODATA, request.stop);
        curl_easy_setopt(h.curl, CURLOPT_NOPROGRESS, 0L);
    }

    for (const auto& [key, val] : request.headers)
        h.headers = curl_slist_append(h.headers, (key + ": " + val).c_str());

    if (!request.form.empty()) {
        build_form(h, request.form);
    } else if (request.method == "POST") {
        h.headers = curl_slist_append(h.headers, "Content-Type: application/json");
        curl_easy_setopt(h.curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(h.curl, CURLOPT_POSTFIELDSIZE, (long)request.body.size());
    }
    if (h.headers)
        curl_easy_setopt(h.curl, CURLOPT_HTTPHEADER, h.headers);

    log_debug("HTTP %s %s (timeout %lds)", request.method.c_str(), request.url.c_str(),
              request.timeout_seconds);

    CURLcode res = curl_easy_perform(h.curl);
    if (res != CURLE_OK) {
        std::string err = curl_easy_strerror(res);
        if (res == CURLE_OPERATION_TIMEDOUT)
            throw PipelineError(ErrorKind::Timeout,
                                "Request timed out after " +
                                std::to_string(request.timeout_seconds) + "s (" + request.url + ")");
        if (res == CURLE_ABORTED_BY_CALLBACK)
            throw PipelineError(ErrorKind::Cancelled, "Request cancelled (" + request.url + ")");
        throw PipelineError(ErrorKind::NetworkError,
                            "HTTP " + request.method + " failed: " + err + " (" + request.url + ")");
    }

    curl_easy_getinfo(h.curl, CURLINFO_RESPONSE_CODE, &response.status);
    log_debug("HTTP %ld, %zu bytes", response.status, response.body.size());
    return response;
}

HttpRequest make_get(const std::string& url, const std::string& bearer, long timeout_seconds) {
    HttpRequest req;
    req.method = "GET";
    req.url = url;
    req.headers["Authorization"] = "Bearer " + bearer;
    req.timeout_seconds = timeout_seconds;
    return req;
}

HttpRequest make_post_json(const std::string& url, const std::string& bearer,
                           const std::string& json_body, long timeout_seconds) {
    HttpRequest req;
    req.method = "POST";
    req.url = url;
    req.headers["Authorization"] = "Bearer " + bearer;
    req.body = json_body;
    req.timeout_seconds = timeout_seconds;
    return req;
}

} // namespace recscribe
