#pragma once

#include "../ReefTypes.h"

#include <cstddef>
#include <string>
#include <vector>

namespace reefradar {
namespace embedding {

struct EmbeddingBatch {
    std::vector<Embedding> embeddings;  // one per input window, same order
    std::size_t dimension{0};
};

/**
 * EmbeddingSource: learned embedding model behind an explicit capability
 *
 * Implementations receive windows of exactly contract::WINDOW_SAMPLES samples
 * at the given nominal sample rate and return one vector per window. Any
 * failure is reported by throwing; the pipeline then falls back to synthetic
 * embeddings. Implementations must tolerate being called from a worker thread
 * and being abandoned after a timeout.
 */
class EmbeddingSource {
public:
    virtual ~EmbeddingSource() = default;

    virtual EmbeddingBatch embed(const std::vector<Window>& windows, int sampleRate) = 0;

    virtual std::string name() const { return "embedding-source"; }
};

}  // namespace embedding
}  // namespace reefradar
