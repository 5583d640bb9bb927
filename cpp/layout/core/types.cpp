#include "layout/core/types.h"

namespace layout {

const char* layoutErrorName(LayoutError error) noexcept {
    switch (error) {
        case LayoutError::Ok: return "Ok";
        case LayoutError::InvalidCalibrationInput: return "InvalidCalibrationInput";
        case LayoutError::PlacementSessionInactive: return "PlacementSessionInactive";
        case LayoutError::HistoryBoundary: return "HistoryBoundary";
        case LayoutError::UnknownIdentity: return "UnknownIdentity";
        case LayoutError::InvalidSnapshot: return "InvalidSnapshot";
        case LayoutError::InvalidOperation: return "InvalidOperation";
        case LayoutError::ScaleRequired: return "ScaleRequired";
        case LayoutError::InvalidImportRecord: return "InvalidImportRecord";
        case LayoutError::BufferTruncated: return "BufferTruncated";
        case LayoutError::InvalidMagic: return "InvalidMagic";
        case LayoutError::UnsupportedVersion: return "UnsupportedVersion";
        case LayoutError::InvalidPayloadSize: return "InvalidPayloadSize";
    }
    return "Unknown";
}

} // namespace layout
