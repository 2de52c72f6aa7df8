#pragma once
#include "credentials.hpp"
#include "../http.hpp"
#include <ctime>
#include <string>
#include <vector>

namespace ssmpatch {

std::string sha256_hex(const std::string& data);

// Raw (binary) HMAC-SHA256 digest
std::string hmac_sha256(const std::string& key, const std::string& data);

struct SigningScope {
    std::string region;
    std::string service;
};

// AWS Signature Version 4 for a request with an empty query string.
// Returns `headers` plus host, x-amz-date, x-amz-security-token (when the
// credentials carry a session token) and authorization. Every returned header
// is signed.
std::vector<Header> sign_request(const std::string& method,
                                 const std::string& host,
                                 const std::string& path,
                                 const std::vector<Header>& headers,
                                 const std::string& body,
                                 const Credentials& credentials,
                                 const SigningScope& scope,
                                 std::time_t now);

} // namespace ssmpatch
