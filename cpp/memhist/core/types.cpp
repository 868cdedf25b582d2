#include "memhist/core/types.h"

namespace memhist {

const char* errorName(HistoryError error) noexcept {
    switch (error) {
        case HistoryError::Ok: return "Ok";
        case HistoryError::InvalidArgument: return "InvalidArgument";
        case HistoryError::RegionTooLarge: return "RegionTooLarge";
        case HistoryError::OutOfMemory: return "OutOfMemory";
        case HistoryError::NotInitialized: return "NotInitialized";
        case HistoryError::AlreadyInitialized: return "AlreadyInitialized";
        case HistoryError::InvalidConfig: return "InvalidConfig";
        case HistoryError::Destroyed: return "Destroyed";
    }
    return "Unknown";
}

} // namespace memhist
