#pragma once

#include "../CoreContract.h"
#include "../ReefTypes.h"

namespace reefradar {
namespace classify {

/**
 * ProjectionVisualizer: display-only 2D coordinates
 *
 * x = mean of the first half of the vector, y = mean of the second half
 * (split at size/2). Does not preserve distances.
 */
class ProjectionVisualizer {
public:
    static Projection2D project(const Embedding& embedding);

    // Query point plus the first `maxPoints` corpus sites, minus those without an embedding.
    Visualization visualize(const Embedding& query,
                            const Corpus& corpus,
                            std::size_t maxPoints = contract::MAX_REFERENCE_POINTS) const;
};

}  // namespace classify
}  // namespace reefradar
