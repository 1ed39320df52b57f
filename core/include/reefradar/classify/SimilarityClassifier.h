#pragma once

#include "../CoreContract.h"
#include "../ReefTypes.h"

#include <cstddef>
#include <vector>

namespace reefradar {
namespace classify {

/**
 * SimilarityClassifier: cosine-similarity classification against the corpus
 *
 * classify():
 *   - per category, mean cosine similarity of the query to that category's
 *     sites; a category without sites scores EMPTY_CATEGORY_SCORE (0.1)
 *   - scores are divided by their sum when the sum is positive
 *   - label = highest score; ties go to the earlier category in
 *     kCategoryPriority (healthy, degraded, restored_early, restored_mid)
 *
 * The 0.1 placeholder and the healthy-first tie-break are inherited policy
 * with no statistical meaning.
 *
 * Sites whose embedding dimension differs from the query are skipped.
 */
class SimilarityClassifier {
public:
    SimilarityClassifier() = default;

    /**
     * @return placeholder_classification() for an empty corpus
     * @throws ReefError(DimensionMismatch) when the corpus is non-empty but no
     *         site shares the query's dimension
     */
    ClassificationResult classify(const Embedding& query, const Corpus& corpus) const;

    /**
     * Top-k sites by cosine similarity, descending; equal similarities keep
     * corpus order. An empty corpus yields placeholder_sites(k).
     */
    std::vector<SimilarSite> nearest_sites(const Embedding& query,
                                           const Corpus& corpus,
                                           std::size_t k = contract::DEFAULT_TOP_K) const;

    // Neutral distribution used while no reference corpus is loaded.
    static ClassificationResult placeholder_classification();

    // Illustrative demo neighbors for an empty corpus. Not a real search.
    static std::vector<SimilarSite> placeholder_sites(std::size_t k);
};

}  // namespace classify
}  // namespace reefradar
