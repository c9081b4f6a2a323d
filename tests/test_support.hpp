#pragma once

#include "errors.hpp"
#include "http_client.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/null_sink.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

inline std::shared_ptr<spdlog::logger> MakeTestLogger() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

inline std::filesystem::path MakeTempDir(const std::string& test_name) {
    auto dir = std::filesystem::temp_directory_path() / "imgharvest_tests" / test_name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

// Serves canned responses; unknown URLs fail like a refused connection.
class FakeHttpClient : public HttpClient {
public:
    void add(const std::string& url, long status, std::string body, std::string content_type = "text/html",
             std::string final_url = {}) {
        HttpResponse r;
        r.final_url = final_url.empty() ? url : final_url;
        r.status = status;
        r.content_type = std::move(content_type);
        r.body = std::move(body);
        responses_[url] = std::move(r);
    }

    void delay(const std::string& url, std::chrono::milliseconds d) { delays_[url] = d; }

    HttpResponse get(const std::string& url) override {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            requested_.push_back(url);
        }
        auto d = delays_.find(url);
        if (d != delays_.end()) std::this_thread::sleep_for(d->second);

        auto it = responses_.find(url);
        if (it == responses_.end()) throw FetchError(url, "connection refused");
        return it->second;
    }

    std::vector<std::string> requested() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return requested_;
    }

private:
    std::map<std::string, HttpResponse> responses_;
    std::map<std::string, std::chrono::milliseconds> delays_;
    std::vector<std::string> requested_;
    mutable std::mutex mtx_;
};
