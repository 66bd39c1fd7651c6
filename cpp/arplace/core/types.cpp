#include "arplace/core/types.h"

namespace arplace {

const char* arErrorName(ArError error) noexcept {
    switch (error) {
        case ArError::Ok: return "Ok";
        case ArError::NoValidSurface: return "NoValidSurface";
        case ArError::InvalidIndex: return "InvalidIndex";
        case ArError::NullAsset: return "NullAsset";
        case ArError::MissingCollaborator: return "MissingCollaborator";
        case ArError::TransitionInProgress: return "TransitionInProgress";
        case ArError::InvalidArgument: return "InvalidArgument";
        case ArError::InvalidOperation: return "InvalidOperation";
    }
    return "Unknown";
}

} // namespace arplace
