#pragma once

#include <string>

struct HttpResponse {
    std::string final_url;   // after redirects
    long status = 0;
    std::string content_type;
    std::string body;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // One GET, redirects followed. Throws FetchError when no response arrives
    // (connection failure, timeout); HTTP error statuses are returned as-is.
    virtual HttpResponse get(const std::string& url) = 0;
};

class CprHttpClient : public HttpClient {
public:
    CprHttpClient(int timeout_ms, std::string user_agent);

    HttpResponse get(const std::string& url) override;

private:
    int timeout_ms_;
    std::string user_agent_;
};

// GET that only accepts 2xx responses.
class PageFetcher {
public:
    explicit PageFetcher(HttpClient& client) : client_(client) {}

    // Throws FetchError on transport failure or a non-2xx status.
    HttpResponse fetch(const std::string& url) const;

private:
    HttpClient& client_;
};
