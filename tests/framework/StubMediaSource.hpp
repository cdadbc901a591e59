#pragma once

#include "backend/MediaSource.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tessera::test {

// In-memory MediaSource. Fetches stay outstanding until the test resolves
// or fails them, unless an automatic outcome was registered for the URL.
class StubMediaSource : public backend::MediaSource {
public:
    enum class Outcome { Manual, Succeed, Fail, Unsupported };

    void fetch(const std::string& url, SuccessCallback on_success, FailureCallback on_failure) override {
        requests.push_back(url);

        Outcome outcome = default_outcome;
        auto it = outcomes.find(url);
        if (it != outcomes.end()) outcome = it->second;

        switch (outcome) {
        case Outcome::Succeed:
            on_success(make_handle(url));
            return;
        case Outcome::Fail:
            on_failure({model::LoadErrorKind::TransientLoadFailure, "stub failure"});
            return;
        case Outcome::Unsupported:
            on_failure({model::LoadErrorKind::UnsupportedResourceType, "stub unsupported"});
            return;
        case Outcome::Manual:
            outstanding_.push_back({url, std::move(on_success), std::move(on_failure)});
            return;
        }
    }

    // Completes the oldest outstanding fetch for url; false if none
    bool resolve(const std::string& url) {
        for (auto it = outstanding_.begin(); it != outstanding_.end(); ++it) {
            if (it->url != url) continue;
            auto cb = std::move(it->on_success);
            outstanding_.erase(it);
            cb(make_handle(url));
            return true;
        }
        return false;
    }

    bool fail(const std::string& url,
              model::LoadErrorKind kind = model::LoadErrorKind::TransientLoadFailure) {
        for (auto it = outstanding_.begin(); it != outstanding_.end(); ++it) {
            if (it->url != url) continue;
            auto cb = std::move(it->on_failure);
            outstanding_.erase(it);
            cb(model::LoadError{kind, "stub failure"});
            return true;
        }
        return false;
    }

    size_t outstanding() const { return outstanding_.size(); }

    size_t count_requests(const std::string& url) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r == url) n++;
        }
        return n;
    }

    static model::MediaHandlePtr make_handle(const std::string& url) {
        auto handle = std::make_shared<model::MediaHandle>();
        handle->url = url;
        handle->data = {0x89, 'P', 'N', 'G'};
        handle->mime_type = "image/png";
        handle->width = 1;
        handle->height = 1;
        return handle;
    }

    std::vector<std::string> requests;
    std::map<std::string, Outcome> outcomes;
    Outcome default_outcome = Outcome::Manual;

private:
    struct Pending {
        std::string url;
        SuccessCallback on_success;
        FailureCallback on_failure;
    };
    std::vector<Pending> outstanding_;
};

}  // namespace tessera::test
