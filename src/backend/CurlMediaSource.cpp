#include "backend/CurlMediaSource.hpp"
#include "backend/MediaDecoder.hpp"
#include "url/UrlUtils.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace tessera::backend {

namespace {

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::atomic<int> instance_counter{0};

}  // namespace

CurlMediaSource::CurlMediaSource(events::EventLoop& loop, NetworkOptions options)
    : loop_(loop), options_(std::move(options)) {
    ensure_curl_global_init();

    multi_ = curl_multi_init();
    if (!multi_) {
        throw std::runtime_error("curl_multi_init failed");
    }

    task_name_ = "curl-multi-" + std::to_string(instance_counter++);
    loop_.schedule(task_name_, std::chrono::milliseconds(0), [this] { pump(); });
}

CurlMediaSource::~CurlMediaSource() {
    loop_.unschedule(task_name_);

    for (auto& [easy, transfer] : transfers_) {
        curl_multi_remove_handle(multi_, easy);
        curl_easy_cleanup(easy);
    }
    transfers_.clear();

    curl_multi_cleanup(multi_);
}

size_t CurlMediaSource::write_body(char* data, size_t size, size_t count, void* userp) {
    const size_t n = size * count;
    auto* transfer = static_cast<Transfer*>(userp);
    transfer->body.insert(transfer->body.end(),
                          reinterpret_cast<const uint8_t*>(data),
                          reinterpret_cast<const uint8_t*>(data) + n);
    return n;
}

void CurlMediaSource::fetch(const std::string& url, SuccessCallback on_success, FailureCallback on_failure) {
    if (url::is_blank_source(url)) {
        on_failure(model::LoadError{model::LoadErrorKind::EmptyOrInvalidSource, "empty source"});
        return;
    }

    auto transfer = std::make_unique<Transfer>();
    transfer->url = url;
    transfer->on_success = std::move(on_success);
    transfer->on_failure = std::move(on_failure);

    transfer->easy = curl_easy_init();
    if (!transfer->easy) {
        transfer->on_failure(model::LoadError{model::LoadErrorKind::TransientLoadFailure, "curl_easy_init failed"});
        return;
    }

    const std::string target = starts_with(url, "/") ? "file://" + url : url;

    CURL* easy = transfer->easy;
    curl_easy_setopt(easy, CURLOPT_URL, target.c_str());
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easy, CURLOPT_MAXREDIRS, options_.max_redirects);
    curl_easy_setopt(easy, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(easy, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
    curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlMediaSource::write_body);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, transfer.get());

    CURLMcode rc = curl_multi_add_handle(multi_, easy);
    if (rc != CURLM_OK) {
        util::Logger::error("CurlMediaSource: curl_multi_add_handle failed for " + url + ": " +
                            curl_multi_strerror(rc));
        curl_easy_cleanup(easy);
        transfer->on_failure(model::LoadError{model::LoadErrorKind::TransientLoadFailure, curl_multi_strerror(rc)});
        return;
    }

    util::Logger::debug("CurlMediaSource: Started " + target);
    transfers_.emplace(easy, std::move(transfer));
}

void CurlMediaSource::pump() {
    if (transfers_.empty()) {
        return;
    }

    int running = 0;
    CURLMcode rc = curl_multi_perform(multi_, &running);
    if (rc != CURLM_OK) {
        util::Logger::warn(std::string("CurlMediaSource: curl_multi_perform: ") + curl_multi_strerror(rc));
    }

    // Collect first: completions may start new transfers
    std::vector<std::pair<std::unique_ptr<Transfer>, CURLcode>> done;
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_, &queued)) {
        if (msg->msg != CURLMSG_DONE) continue;

        CURL* easy = msg->easy_handle;
        CURLcode code = msg->data.result;
        curl_multi_remove_handle(multi_, easy);

        auto it = transfers_.find(easy);
        if (it == transfers_.end()) {
            curl_easy_cleanup(easy);
            continue;
        }
        done.emplace_back(std::move(it->second), code);
        transfers_.erase(it);
    }

    for (auto& [transfer, code] : done) {
        finish(std::move(transfer), code);
    }
}

void CurlMediaSource::finish(std::unique_ptr<Transfer> transfer, CURLcode code) {
    long status = 0;
    char* content_type_raw = nullptr;
    curl_easy_getinfo(transfer->easy, CURLINFO_RESPONSE_CODE, &status);
    curl_easy_getinfo(transfer->easy, CURLINFO_CONTENT_TYPE, &content_type_raw);
    std::string content_type = content_type_raw ? content_type_raw : "";
    curl_easy_cleanup(transfer->easy);
    transfer->easy = nullptr;

    if (code != CURLE_OK) {
        util::Logger::warn("CurlMediaSource: " + transfer->url + ": " + curl_easy_strerror(code));
        transfer->on_failure(model::LoadError{model::LoadErrorKind::TransientLoadFailure, curl_easy_strerror(code)});
        return;
    }

    const bool local = starts_with(transfer->url, "/") || starts_with(transfer->url, "file://");
    if (!local && (status < 200 || status >= 300)) {
        util::Logger::warn("CurlMediaSource: " + transfer->url + " returned HTTP " + std::to_string(status));
        transfer->on_failure(model::LoadError{model::LoadErrorKind::TransientLoadFailure,
                                              "HTTP " + std::to_string(status)});
        return;
    }

    auto handle = std::make_shared<model::MediaHandle>();
    handle->url = transfer->url;
    handle->type = url::classify_media(transfer->url);
    if (starts_with(content_type, "video/")) {
        handle->type = model::MediaType::Video;
    }

    if (handle->type == model::MediaType::Video) {
        handle->mime_type = content_type;
        handle->data = std::move(transfer->body);
        transfer->on_success(std::move(handle));
        return;
    }

    auto info = MediaDecoder::inspect(transfer->body);
    if (!info) {
        util::Logger::warn("CurlMediaSource: Undecodable payload from " + transfer->url +
                           " (" + std::to_string(transfer->body.size()) + " bytes, " +
                           (content_type.empty() ? "no content type" : content_type) + ")");
        transfer->on_failure(model::LoadError{model::LoadErrorKind::UnsupportedResourceType,
                                              "undecodable payload"});
        return;
    }

    handle->width = info->width;
    handle->height = info->height;
    handle->mime_type = starts_with(content_type, "image/") ? content_type : info->mime_type;
    if (info->mime_type == "image/gif") {
        handle->type = model::MediaType::Gif;
    }
    handle->data = std::move(transfer->body);
    transfer->on_success(std::move(handle));
}

}  // namespace tessera::backend
