#include "sigv4.hpp"
#include "../util.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>

namespace ssmpatch {

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return hex_encode(hash, SHA256_DIGEST_LENGTH);
}

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &out_len);
    return std::string(reinterpret_cast<const char*>(out), out_len);
}

std::vector<Header> sign_request(const std::string& method,
                                 const std::string& host,
                                 const std::string& path,
                                 const std::vector<Header>& headers,
                                 const std::string& body,
                                 const Credentials& credentials,
                                 const SigningScope& scope,
                                 std::time_t now) {
    std::string amz_date = format_utc(now, "%Y%m%dT%H%M%SZ");
    std::string date = amz_date.substr(0, 8);

    std::vector<Header> out = headers;
    out.emplace_back("host", host);
    out.emplace_back("x-amz-date", amz_date);
    if (!credentials.session_token.empty()) {
        out.emplace_back("x-amz-security-token", credentials.session_token);
    }

    // Canonical headers: lowercase names, trimmed values, sorted by name
    std::vector<Header> canonical;
    canonical.reserve(out.size());
    for (const auto& h : out) {
        canonical.emplace_back(to_lower(h.first), trim(h.second));
    }
    std::sort(canonical.begin(), canonical.end());

    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& h : canonical) {
        canonical_headers += h.first + ":" + h.second + "\n";
        if (!signed_headers.empty()) signed_headers += ';';
        signed_headers += h.first;
    }

    std::string canonical_request = method + "\n" +
                                    (path.empty() ? "/" : path) + "\n" +
                                    "\n" +  // query string
                                    canonical_headers + "\n" +
                                    signed_headers + "\n" +
                                    sha256_hex(body);

    std::string credential_scope =
        date + "/" + scope.region + "/" + scope.service + "/aws4_request";
    std::string string_to_sign = "AWS4-HMAC-SHA256\n" + amz_date + "\n" +
                                 credential_scope + "\n" + sha256_hex(canonical_request);

    std::string k_date = hmac_sha256("AWS4" + credentials.secret_access_key, date);
    std::string k_region = hmac_sha256(k_date, scope.region);
    std::string k_service = hmac_sha256(k_region, scope.service);
    std::string k_signing = hmac_sha256(k_service, "aws4_request");
    std::string raw_sig = hmac_sha256(k_signing, string_to_sign);
    std::string signature =
        hex_encode(reinterpret_cast<const unsigned char*>(raw_sig.data()), raw_sig.size());

    out.emplace_back("authorization",
                     "AWS4-HMAC-SHA256 Credential=" + credentials.access_key_id + "/" +
                         credential_scope + ", SignedHeaders=" + signed_headers +
                         ", Signature=" + signature);
    return out;
}

} // namespace ssmpatch
