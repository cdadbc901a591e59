#pragma once

#include "model/MediaHandle.hpp"
#include <cstdint>
#include <string>

namespace tessera::model {

enum class AttemptState {
    Idle,
    Requesting,
    Succeeded,   // Terminal: the desired resource (or a retry of it) loaded
    Failed,      // Terminal: nothing further to try
};

const char* to_string(AttemptState state);

// Per-consumer bookkeeping for one desired resource.
// generation is bumped every time the desired resource changes; callbacks
// capture it and are discarded when it no longer matches.
struct LoadAttempt {
    std::string target_key;
    uint64_t generation = 0;
    int retries_used = 0;
    bool using_fallback = false;
    std::string current_source;
    AttemptState state = AttemptState::Idle;
};

// What the consumer should draw right now.
struct DisplayState {
    AttemptState state = AttemptState::Idle;
    std::string source;          // URL being shown (original, retry or fallback)
    MediaHandlePtr handle;       // Set once something loaded
    bool showing_fallback = false;
    bool error = false;          // Fallback reached; no error decoration beyond the image itself
    int retries_used = 0;
    uint64_t generation = 0;

    bool terminal() const {
        return state == AttemptState::Succeeded || state == AttemptState::Failed;
    }
};

}  // namespace tessera::model
