#pragma once

#include "../ReefTypes.h"

#include <vector>

namespace reefradar {
namespace embedding {

/**
 * EmbeddingAggregator: reduce per-window embeddings to one vector
 *
 * Elementwise arithmetic mean. Order-independent.
 */
class EmbeddingAggregator {
public:
    /**
     * @throws ReefError(EmptyBatch) for an empty batch
     * @throws ReefError(DimensionMismatch) when vectors differ in length
     */
    Embedding aggregate(const std::vector<Embedding>& embeddings) const;
};

}  // namespace embedding
}  // namespace reefradar
