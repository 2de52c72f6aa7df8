#pragma once
#include "http.hpp"
#include <deque>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ssmpatch {

struct RecordedRequest {
    std::string url;
    std::string body;
    std::vector<Header> headers;

    // Empty when the header was not sent
    std::string header(const std::string& name) const {
        for (const auto& [k, v] : headers) {
            if (k == name) return v;
        }
        return "";
    }

    nlohmann::json json() const { return nlohmann::json::parse(body); }
};

// HttpClient that answers from a scripted reply list and keeps every request.
// Once the script runs out every call gets `fallback`.
class RecordingHttpClient : public HttpClient {
public:
    std::deque<HttpResponse> replies;
    HttpResponse fallback{200, "{}", ""};
    std::vector<RecordedRequest> requests;

    void reply(long status, const std::string& body) { replies.push_back({status, body, ""}); }
    void reply_json(const std::string& body) { reply(200, body); }
    void drop_connection(const std::string& reason) { replies.push_back({0, "", reason}); }

    const RecordedRequest& last() const { return requests.back(); }

    HttpResponse post(const std::string& url, const std::string& body,
                      const std::vector<Header>& headers, long /*timeout_seconds*/) override {
        requests.push_back({url, body, headers});
        if (replies.empty()) return fallback;
        HttpResponse next = replies.front();
        replies.pop_front();
        return next;
    }
};

} // namespace ssmpatch
