#pragma once

#include <stdexcept>
#include <string>

namespace reefradar {

/**
 * ErrorCode - Stable machine-readable failure codes
 *
 * The string forms (error_code_to_string) are persisted in the analyses table
 * and printed by the CLI; do not rename them.
 */
enum class ErrorCode {
    InvalidFormat,               // INVALID_AUDIO_FORMAT: malformed or unsupported container
    AudioTooShort,               // AUDIO_TOO_SHORT: below the minimum duration / no full window
    AudioTooLong,                // AUDIO_TOO_LONG: above the maximum duration
    EmptyBatch,                  // EMPTY_BATCH: aggregation reached with no embeddings
    EmbeddingSourceUnavailable,  // EMBEDDING_SOURCE_UNAVAILABLE: absorbed by synthetic fallback
    EmptyCorpus,                 // EMPTY_CORPUS: placeholder results returned
    DimensionMismatch,           // DIMENSION_MISMATCH: query vs. corpus / inconsistent batch
    StorageFailure,              // STORAGE_FAILURE: SQLite errors
    ProcessingFailed             // PROCESSING_FAILED: anything else
};

std::string error_code_to_string(ErrorCode code);

// User-facing failures are not retriable without different input.
bool is_user_error(ErrorCode code);

class ReefError : public std::runtime_error {
  public:
    ReefError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

  private:
    ErrorCode code_;
};

}  // namespace reefradar
