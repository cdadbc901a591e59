#pragma once

#include "model/MediaHandle.hpp"
#include <functional>
#include <string>

namespace tessera::backend {

// The network-capable loading primitive the engine drives. Each fetch must
// end in exactly one callback, either synchronously or from a later
// event-loop turn. Implementations never retry.
class MediaSource {
public:
    using SuccessCallback = std::function<void(model::MediaHandlePtr)>;
    using FailureCallback = std::function<void(const model::LoadError&)>;

    virtual ~MediaSource() = default;

    virtual void fetch(const std::string& url, SuccessCallback on_success, FailureCallback on_failure) = 0;
};

}  // namespace tessera::backend
