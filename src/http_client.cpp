#include "http_client.hpp"

#include "errors.hpp"

#include <cpr/cpr.h>

CprHttpClient::CprHttpClient(int timeout_ms, std::string user_agent)
    : timeout_ms_(timeout_ms), user_agent_(std::move(user_agent)) {}

HttpResponse CprHttpClient::get(const std::string& url) {
    cpr::Response r = cpr::Get(cpr::Url{url},
                               cpr::Header{{"User-Agent", user_agent_}},
                               cpr::Timeout{timeout_ms_},
                               cpr::Redirect{true});
    if (r.error) {
        throw FetchError(url, "request failed: " + r.error.message);
    }

    HttpResponse out;
    out.final_url = r.url.str().empty() ? url : r.url.str();
    out.status = r.status_code;
    // cpr::Header compares keys case-insensitively
    auto it = r.header.find("Content-Type");
    if (it != r.header.end()) out.content_type = it->second;
    out.body = std::move(r.text);
    return out;
}

HttpResponse PageFetcher::fetch(const std::string& url) const {
    HttpResponse r = client_.get(url);
    if (r.status < 200 || r.status >= 300) {
        throw FetchError(url, "unexpected status " + std::to_string(r.status));
    }
    if (r.final_url.empty()) r.final_url = url;
    return r;
}
