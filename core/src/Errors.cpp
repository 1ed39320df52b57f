#include "reefradar/Errors.h"

namespace reefradar {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidFormat:
            return "INVALID_AUDIO_FORMAT";
        case ErrorCode::AudioTooShort:
            return "AUDIO_TOO_SHORT";
        case ErrorCode::AudioTooLong:
            return "AUDIO_TOO_LONG";
        case ErrorCode::EmptyBatch:
            return "EMPTY_BATCH";
        case ErrorCode::EmbeddingSourceUnavailable:
            return "EMBEDDING_SOURCE_UNAVAILABLE";
        case ErrorCode::EmptyCorpus:
            return "EMPTY_CORPUS";
        case ErrorCode::DimensionMismatch:
            return "DIMENSION_MISMATCH";
        case ErrorCode::StorageFailure:
            return "STORAGE_FAILURE";
        case ErrorCode::ProcessingFailed:
            return "PROCESSING_FAILED";
    }
    return "PROCESSING_FAILED";
}

bool is_user_error(ErrorCode code) {
    return code == ErrorCode::InvalidFormat ||
           code == ErrorCode::AudioTooShort ||
           code == ErrorCode::AudioTooLong;
}

}  // namespace reefradar
