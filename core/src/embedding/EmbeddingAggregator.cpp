#include "reefradar/embedding/EmbeddingAggregator.h"
#include "reefradar/Errors.h"

#include <string>

namespace reefradar {
namespace embedding {

Embedding EmbeddingAggregator::aggregate(const std::vector<Embedding>& embeddings) const {
    if (embeddings.empty()) {
        throw ReefError(ErrorCode::EmptyBatch, "Cannot aggregate an empty embedding batch");
    }

    const std::size_t dim = embeddings.front().size();
    Embedding mean(dim, 0.0);
    for (std::size_t e = 0; e < embeddings.size(); ++e) {
        if (embeddings[e].size() != dim) {
            throw ReefError(ErrorCode::DimensionMismatch,
                            "Embedding " + std::to_string(e) + " has dimension " +
                            std::to_string(embeddings[e].size()) + ", expected " + std::to_string(dim));
        }
        for (std::size_t i = 0; i < dim; ++i) mean[i] += embeddings[e][i];
    }
    const double n = static_cast<double>(embeddings.size());
    for (double& v : mean) v /= n;
    return mean;
}

}  // namespace embedding
}  // namespace reefradar
