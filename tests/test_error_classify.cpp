// Copyright (c) 2026 John Suykerbuyk and SykeTech LTD
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include "error_classify.h"

#include <string>

using namespace recscribe;

TEST_CASE("extract_provider_message: object form", "[error_classify]") {
    CHECK(extract_provider_message(R"({"error":{"message":"Bad key","type":"auth"}})") == "Bad key");
}

TEST_CASE("extract_provider_message: string form", "[error_classify]") {
    CHECK(extract_provider_message(R"({"error":"plain"})") == "plain");
}

TEST_CASE("extract_provider_message: absent or not JSON", "[error_classify]") {
    CHECK(extract_provider_message("").empty());
    CHECK(extract_provider_message("<html>502</html>").empty());
    CHECK(extract_provider_message(R"({"detail":"x"})").empty());
    CHECK(extract_provider_message(R"({"error":{"code":5}})").empty());
    CHECK(extract_provider_message("[1,2]").empty());
}

TEST_CASE("looks_like_quota_error: markers are case-insensitive", "[error_classify]") {
    CHECK(looks_like_quota_error(R"({"error":{"code":"insufficient_quota"}})"));
    CHECK(looks_like_quota_error("You exceeded your current QUOTA"));
    CHECK(looks_like_quota_error("rate_limit_exceeded"));
    CHECK(looks_like_quota_error("Check your Billing details"));
    CHECK_FALSE(looks_like_quota_error("model not found"));
    CHECK_FALSE(looks_like_quota_error(""));
}

TEST_CASE("classify_http_error: 401 is an invalid key regardless of body", "[error_classify]") {
    const auto* openai = find_provider(Provider::OpenAI);

    auto e = classify_http_error(401, "", openai);
    CHECK(e.kind() == ErrorKind::InvalidApiKey);
    CHECK(e.http_status() == 401);
    CHECK(std::string(e.what()) == "Invalid API key. Check your OpenAI API key.");

    auto q = classify_http_error(401, R"({"error":{"message":"quota billing"}})", openai);
    CHECK(q.kind() == ErrorKind::InvalidApiKey);
    CHECK(std::string(q.what()) == "quota billing");
}

TEST_CASE("classify_http_error: 429 is quota regardless of body", "[error_classify]") {
    auto e = classify_http_error(429, "slow down", nullptr);
    CHECK(e.kind() == ErrorKind::QuotaExceeded);
    CHECK(e.http_status() == 429);
}

TEST_CASE("classify_http_error: other 4xx upgraded by quota heuristic", "[error_classify]") {
    auto quota = classify_http_error(
        403, R"({"error":{"message":"You exceeded your current quota","code":"insufficient_quota"}})");
    CHECK(quota.kind() == ErrorKind::QuotaExceeded);
    CHECK(std::string(quota.what()) == "You exceeded your current quota");

    auto plain = classify_http_error(400, R"({"error":{"message":"Invalid file format"}})");
    CHECK(plain.kind() == ErrorKind::ServerError);
    CHECK(plain.http_status() == 400);
}

TEST_CASE("classify_http_error: 5xx is a server error", "[error_classify]") {
    // A quota-looking 5xx body stays a server error
    auto e = classify_http_error(503, "billing backend unavailable");
    CHECK(e.kind() == ErrorKind::ServerError);
    CHECK(std::string(e.what()) == "Server error (503): billing backend unavailable");
}

TEST_CASE("classify_http_error: server error message detail", "[error_classify]") {
    auto with_msg = classify_http_error(500, R"({"error":{"message":"Internal failure"}})");
    CHECK(std::string(with_msg.what()) == "Server error (500): Internal failure");

    auto empty = classify_http_error(502, "  \n");
    CHECK(std::string(empty.what()) == "Server error (502): no response body");
    CHECK(empty.http_status() == 502);
}
