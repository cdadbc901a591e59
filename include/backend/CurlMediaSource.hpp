#pragma once

#include "backend/MediaSource.hpp"
#include "events/EventLoop.hpp"
#include <curl/curl.h>
#include <chrono>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tessera::backend {

struct NetworkOptions {
    std::string user_agent = "tessera/1.0";
    long max_redirects = 10;
    std::chrono::milliseconds connect_timeout{10000};
};

// MediaSource over libcurl's multi interface. Transfers progress from a
// periodic event-loop task, so fetch() never blocks and every callback runs
// on the loop. Absolute local paths ("/images/x.jpg") are read as file:// URLs.
class CurlMediaSource : public MediaSource {
public:
    explicit CurlMediaSource(events::EventLoop& loop, NetworkOptions options = {});
    ~CurlMediaSource() override;

    CurlMediaSource(const CurlMediaSource&) = delete;
    CurlMediaSource& operator=(const CurlMediaSource&) = delete;

    void fetch(const std::string& url, SuccessCallback on_success, FailureCallback on_failure) override;

    size_t active() const { return transfers_.size(); }

private:
    struct Transfer {
        CURL* easy = nullptr;
        std::string url;
        std::vector<uint8_t> body;
        SuccessCallback on_success;
        FailureCallback on_failure;
    };

    static size_t write_body(char* data, size_t size, size_t count, void* userp);

    void pump();
    void finish(std::unique_ptr<Transfer> transfer, CURLcode code);

    events::EventLoop& loop_;
    NetworkOptions options_;
    CURLM* multi_ = nullptr;
    std::unordered_map<CURL*, std::unique_ptr<Transfer>> transfers_;
    std::string task_name_;
};

}  // namespace tessera::backend
