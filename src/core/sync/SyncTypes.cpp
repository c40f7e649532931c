#include "SyncTypes.hpp"

namespace ReelSync {

const char* syncErrorName(SyncError error) {
    switch (error) {
        case SyncError::MappingError: return "MappingError";
        case SyncError::NetworkError: return "NetworkError";
        case SyncError::FilesystemError: return "FilesystemError";
        case SyncError::AmbiguousContentUnresolved: return "AmbiguousContentUnresolved";
        case SyncError::Cancelled: return "Cancelled";
        case SyncError::DestinationUnavailable: return "DestinationUnavailable";
    }
    return "Unknown";
}

} // namespace ReelSync
