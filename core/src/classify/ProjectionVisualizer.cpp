#include "reefradar/classify/ProjectionVisualizer.h"
#include "reefradar/VectorMath.h"

#include <algorithm>

namespace reefradar {
namespace classify {

Projection2D ProjectionVisualizer::project(const Embedding& embedding) {
    const std::size_t mid = embedding.size() / 2;
    Projection2D p;
    p.x = mean_range(embedding, 0, mid);
    p.y = mean_range(embedding, mid, embedding.size());
    return p;
}

Visualization ProjectionVisualizer::visualize(const Embedding& query,
                                              const Corpus& corpus,
                                              std::size_t maxPoints) const {
    Visualization v;
    v.query = project(query);
    const std::size_t considered = std::min(maxPoints, corpus.size());
    for (std::size_t i = 0; i < considered; ++i) {
        const ReferenceSite& site = corpus[i];
        if (site.meanEmbedding.empty()) continue;
        ReferencePoint point;
        point.siteId = site.siteId;
        point.category = site.category;
        point.position = project(site.meanEmbedding);
        v.referencePoints.push_back(std::move(point));
    }
    return v;
}

}  // namespace classify
}  // namespace reefradar
