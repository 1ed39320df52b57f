#pragma once

#include "EmbeddingSource.h"
#include "SyntheticEmbedding.h"
#include "../CoreContract.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace reefradar {
namespace embedding {

struct EmbeddingServiceOptions {
    std::chrono::milliseconds timeout{contract::DEFAULT_EMBED_TIMEOUT_MS};
    // 0 = all windows in one source call; otherwise chunks of this size,
    // issued concurrently under one shared deadline.
    std::size_t windowsPerCall{0};
    int sampleRate{contract::TARGET_SAMPLE_RATE_HZ};
    std::size_t syntheticDimension{contract::EMBEDDING_DIM};
};

struct EmbeddingOutcome {
    std::vector<Embedding> embeddings;  // one per window
    bool synthetic{false};
    std::string fallbackReason;         // empty unless synthetic
};

/**
 * EmbeddingService: learned embeddings with a synthetic safety net
 *
 * Calls the source on worker threads and waits up to `timeout`. On timeout,
 * on any exception, or on a malformed batch (wrong count or inconsistent
 * dimensions) every window is embedded by SyntheticEmbeddingGenerator
 * instead. The failure is logged and surfaces only as `synthetic = true`.
 *
 * Workers abandoned by a timed-out or failed call stay counted until the
 * source returns. While any remain, embed() skips the source entirely and
 * goes straight to synthetic embeddings.
 *
 * Embedding dimension is not compared with the reference corpus here; that
 * check belongs to classification.
 */
class EmbeddingService {
public:
    EmbeddingService(std::shared_ptr<EmbeddingSource> source, EmbeddingServiceOptions options = {});

    EmbeddingOutcome embed(std::shared_ptr<const std::vector<Window>> windows) const;

    const EmbeddingServiceOptions& options() const { return options_; }

    // Source calls abandoned by an earlier embed() that have not returned yet.
    std::size_t stalled_workers() const;

private:
    std::vector<Embedding> call_source(const std::shared_ptr<const std::vector<Window>>& windows) const;
    std::vector<Embedding> synthesize_all(const std::vector<Window>& windows) const;

    std::shared_ptr<EmbeddingSource> source_;
    EmbeddingServiceOptions options_;
    SyntheticEmbeddingGenerator synthetic_;
    std::shared_ptr<std::atomic<std::size_t>> stalledWorkers_;
};

}  // namespace embedding
}  // namespace reefradar
