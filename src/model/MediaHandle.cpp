#include "model/MediaHandle.hpp"
#include "model/LoadAttempt.hpp"

namespace tessera::model {

const char* to_string(LoadErrorKind kind) {
    switch (kind) {
        case LoadErrorKind::TransientLoadFailure: return "TransientLoadFailure";
        case LoadErrorKind::UnsupportedResourceType: return "UnsupportedResourceType";
        case LoadErrorKind::EmptyOrInvalidSource: return "EmptyOrInvalidSource";
        case LoadErrorKind::Timeout: return "Timeout";
    }
    return "Unknown";
}

const char* to_string(AttemptState state) {
    switch (state) {
        case AttemptState::Idle: return "Idle";
        case AttemptState::Requesting: return "Requesting";
        case AttemptState::Succeeded: return "Succeeded";
        case AttemptState::Failed: return "Failed";
    }
    return "Unknown";
}

}  // namespace tessera::model
