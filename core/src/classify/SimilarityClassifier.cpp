#include "reefradar/classify/SimilarityClassifier.h"
#include "reefradar/Errors.h"
#include "reefradar/Log.h"
#include "reefradar/Utility.h"
#include "reefradar/VectorMath.h"

#include <algorithm>
#include <array>
#include <string>

namespace reefradar {
namespace classify {

namespace {

constexpr const char* kTag = "classifier";

struct PlaceholderSite {
    const char* siteId;
    const char* country;
    double similarity;
};

constexpr std::array<PlaceholderSite, 3> kPlaceholderSites = {{
    {"aus_H1", "Australia", 0.94},
    {"idn_H1", "Indonesia", 0.91},
    {"aus_H2", "Australia", 0.88},
}};

}  // namespace

ClassificationResult SimilarityClassifier::placeholder_classification() {
    ClassificationResult r;
    for (std::size_t i = 0; i < kCategoryPriority.size(); ++i) {
        r.probabilities[i] = CategoryProbability{.category = kCategoryPriority[i],
                                                 .probability = contract::PLACEHOLDER_PROBABILITIES[i]};
    }
    r.label = HealthCategory::Healthy;
    r.confidence = contract::PLACEHOLDER_PROBABILITIES[0];
    r.placeholder = true;
    return r;
}

std::vector<SimilarSite> SimilarityClassifier::placeholder_sites(std::size_t k) {
    std::vector<SimilarSite> sites;
    for (std::size_t i = 0; i < kPlaceholderSites.size() && i < k; ++i) {
        SimilarSite s;
        s.siteId = kPlaceholderSites[i].siteId;
        s.country = kPlaceholderSites[i].country;
        s.category = HealthCategory::Healthy;
        s.similarity = kPlaceholderSites[i].similarity;
        sites.push_back(std::move(s));
    }
    return sites;
}

ClassificationResult SimilarityClassifier::classify(const Embedding& query, const Corpus& corpus) const {
    if (corpus.empty()) {
        REEFRADAR_LOG_WARN(kTag, "reference corpus is empty, returning placeholder classification");
        return placeholder_classification();
    }

    std::array<double, 4> sums{};
    std::array<std::size_t, 4> counts{};
    std::size_t skipped = 0;
    for (const auto& site : corpus) {
        if (site.meanEmbedding.size() != query.size()) {
            ++skipped;
            continue;
        }
        const std::size_t c = category_index(site.category);
        sums[c] += cosine_similarity(query, site.meanEmbedding);
        counts[c] += 1;
    }

    if (skipped == corpus.size()) {
        throw ReefError(ErrorCode::DimensionMismatch,
                        "No reference site matches the query embedding dimension " + std::to_string(query.size()));
    }
    if (skipped > 0) {
        REEFRADAR_LOG_WARN(kTag, "skipped ", skipped, " reference site(s) with mismatched embedding dimension");
    }

    std::array<double, 4> scores{};
    double total = 0.0;
    for (std::size_t c = 0; c < scores.size(); ++c) {
        scores[c] = counts[c] > 0 ? sums[c] / static_cast<double>(counts[c]) : contract::EMPTY_CATEGORY_SCORE;
        total += scores[c];
    }
    if (total > 0.0) {
        for (double& s : scores) s /= total;
    }

    ClassificationResult result;
    std::size_t best = 0;
    for (std::size_t i = 0; i < kCategoryPriority.size(); ++i) {
        const double score = scores[category_index(kCategoryPriority[i])];
        result.probabilities[i] = CategoryProbability{.category = kCategoryPriority[i], .probability = score};
        if (score > result.probabilities[best].probability) best = i;
    }
    result.label = result.probabilities[best].category;
    result.confidence = result.probabilities[best].probability;

    REEFRADAR_LOG_DEBUG(kTag, "label=", category_to_string(result.label), " confidence=", result.confidence);
    return result;
}

std::vector<SimilarSite> SimilarityClassifier::nearest_sites(const Embedding& query,
                                                             const Corpus& corpus,
                                                             std::size_t k) const {
    if (corpus.empty()) return placeholder_sites(k);

    std::vector<SimilarSite> ranked;
    ranked.reserve(corpus.size());
    for (const auto& site : corpus) {
        if (site.meanEmbedding.size() != query.size()) continue;
        SimilarSite s;
        s.siteId = site.siteId;
        s.country = site.country;
        s.category = site.category;
        s.similarity = cosine_similarity(query, site.meanEmbedding);
        ranked.push_back(std::move(s));
    }

    std::stable_sort(ranked.begin(), ranked.end(), [](const SimilarSite& a, const SimilarSite& b) {
        return a.similarity > b.similarity;
    });
    if (ranked.size() > k) ranked.resize(k);
    return ranked;
}

}  // namespace classify
}  // namespace reefradar
