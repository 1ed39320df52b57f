#include "reefradar/classify/ProjectionVisualizer.h"
#include "reefradar/classify/SimilarityClassifier.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

#include <cmath>
#include <string>

using namespace reefradar;
using namespace reefradar::test_support;
using classify::ProjectionVisualizer;
using classify::SimilarityClassifier;

namespace {

ReferenceSite site(const std::string& id, HealthCategory category, Embedding e, const std::string& country = "Australia") {
    ReferenceSite s;
    s.siteId = id;
    s.country = country;
    s.category = category;
    s.meanEmbedding = std::move(e);
    return s;
}

double probability_sum(const ClassificationResult& r) {
    double sum = 0.0;
    for (const auto& p : r.probabilities) sum += p.probability;
    return sum;
}

}  // namespace

TEST(SimilarityClassifierTest, EmptyCorpusReturnsPlaceholder) {
    SimilarityClassifier classifier;
    const ClassificationResult r = classifier.classify({1.0, 2.0}, {});
    EXPECT_TRUE(r.placeholder);
    EXPECT_EQ(r.label, HealthCategory::Healthy);
    EXPECT_DOUBLE_EQ(r.confidence, 0.65);
    EXPECT_DOUBLE_EQ(r.probability_of(HealthCategory::Healthy), 0.65);
    EXPECT_DOUBLE_EQ(r.probability_of(HealthCategory::Degraded), 0.15);
    EXPECT_DOUBLE_EQ(r.probability_of(HealthCategory::RestoredEarly), 0.10);
    EXPECT_DOUBLE_EQ(r.probability_of(HealthCategory::RestoredMid), 0.10);

    const auto sites = classifier.nearest_sites({1.0, 2.0}, {});
    ASSERT_EQ(sites.size(), 3u);
    EXPECT_EQ(sites[0].siteId, "aus_H1");
    EXPECT_EQ(sites[1].siteId, "idn_H1");
    EXPECT_EQ(sites[1].country, "Indonesia");
    EXPECT_EQ(sites[2].siteId, "aus_H2");
    EXPECT_DOUBLE_EQ(sites[0].similarity, 0.94);
    EXPECT_DOUBLE_EQ(sites[2].similarity, 0.88);
}

TEST(SimilarityClassifierTest, CategoryMeansAreNormalized) {
    const Corpus corpus = {
        site("h1", HealthCategory::Healthy, {1.0, 0.0}),
        site("d1", HealthCategory::Degraded, {0.0, 1.0}),
        site("r1", HealthCategory::RestoredEarly, {1.0, 1.0}),
    };
    const ClassificationResult r = SimilarityClassifier().classify({1.0, 0.0}, corpus);

    const double restoredEarly = 1.0 / std::sqrt(2.0);
    const double total = 1.0 + 0.0 + restoredEarly + 0.1;  // restored_mid has no sites
    EXPECT_FALSE(r.placeholder);
    EXPECT_EQ(r.label, HealthCategory::Healthy);
    EXPECT_NEAR(r.confidence, 1.0 / total, 1e-12);
    EXPECT_NEAR(r.probability_of(HealthCategory::RestoredEarly), restoredEarly / total, 1e-12);
    EXPECT_NEAR(r.probability_of(HealthCategory::RestoredMid), 0.1 / total, 1e-12);
    EXPECT_NEAR(probability_sum(r), 1.0, 1e-12);
}

TEST(SimilarityClassifierTest, CategoryScoreIsMeanOverItsSites) {
    const Corpus corpus = {
        site("h1", HealthCategory::Healthy, {1.0, 0.0}),
        site("h2", HealthCategory::Healthy, {0.0, 1.0}),
        site("d1", HealthCategory::Degraded, {1.0, 0.1}),
    };
    const ClassificationResult r = SimilarityClassifier().classify({1.0, 0.0}, corpus);
    // healthy averages 1 and 0; degraded is nearly 1.
    EXPECT_EQ(r.label, HealthCategory::Degraded);
}

TEST(SimilarityClassifierTest, TiesGoToEarlierCategory) {
    const Corpus corpus = {
        site("r1", HealthCategory::RestoredEarly, {2.0, 0.0}),
        site("d1", HealthCategory::Degraded, {1.0, 0.0}),
    };
    const ClassificationResult r = SimilarityClassifier().classify({1.0, 0.0}, corpus);
    EXPECT_EQ(r.label, HealthCategory::Degraded);
    EXPECT_DOUBLE_EQ(r.probability_of(HealthCategory::Degraded), r.probability_of(HealthCategory::RestoredEarly));
}

TEST(SimilarityClassifierTest, NonPositiveTotalIsLeftUnnormalized) {
    const Corpus corpus = {
        site("h", HealthCategory::Healthy, {-1.0, 0.0}),
        site("d", HealthCategory::Degraded, {-1.0, 0.0}),
        site("r", HealthCategory::RestoredEarly, {-1.0, 0.0}),
        site("m", HealthCategory::RestoredMid, {-1.0, 0.0}),
    };
    const ClassificationResult r = SimilarityClassifier().classify({1.0, 0.0}, corpus);
    for (const auto& p : r.probabilities) EXPECT_DOUBLE_EQ(p.probability, -1.0);
    EXPECT_EQ(r.label, HealthCategory::Healthy);
}

TEST(SimilarityClassifierTest, ZeroQueryHasZeroSimilarity) {
    const Corpus corpus = {
        site("h", HealthCategory::Healthy, {1.0, 0.0}),
        site("d", HealthCategory::Degraded, {0.0, 1.0}),
        site("r", HealthCategory::RestoredEarly, {1.0, 1.0}),
        site("m", HealthCategory::RestoredMid, {-1.0, 0.0}),
    };
    SimilarityClassifier classifier;
    const ClassificationResult r = classifier.classify({0.0, 0.0}, corpus);
    for (const auto& p : r.probabilities) EXPECT_EQ(p.probability, 0.0);
    EXPECT_EQ(r.label, HealthCategory::Healthy);
    EXPECT_EQ(r.confidence, 0.0);

    for (const auto& s : classifier.nearest_sites({0.0, 0.0}, corpus, 4)) EXPECT_EQ(s.similarity, 0.0);
}

TEST(SimilarityClassifierTest, IsDeterministic) {
    const Corpus corpus = {
        site("h", HealthCategory::Healthy, {0.3, 0.7, 0.1}),
        site("d", HealthCategory::Degraded, {0.9, 0.2, 0.4}),
    };
    SimilarityClassifier classifier;
    const auto a = classifier.classify({0.5, 0.5, 0.5}, corpus);
    const auto b = classifier.classify({0.5, 0.5, 0.5}, corpus);
    EXPECT_EQ(a.label, b.label);
    for (std::size_t i = 0; i < a.probabilities.size(); ++i) {
        EXPECT_EQ(a.probabilities[i].probability, b.probabilities[i].probability);
    }
}

TEST(SimilarityClassifierTest, MismatchedSitesAreSkipped) {
    const Corpus corpus = {
        site("h", HealthCategory::Healthy, {1.0, 0.0, 0.0}),
        site("d", HealthCategory::Degraded, {1.0, 0.0}),
    };
    SimilarityClassifier classifier;
    const ClassificationResult r = classifier.classify({1.0, 0.0}, corpus);
    EXPECT_EQ(r.label, HealthCategory::Degraded);

    const auto sites = classifier.nearest_sites({1.0, 0.0}, corpus);
    ASSERT_EQ(sites.size(), 1u);
    EXPECT_EQ(sites[0].siteId, "d");
}

TEST(SimilarityClassifierTest, NoMatchingDimensionIsAnError) {
    const Corpus corpus = {site("h", HealthCategory::Healthy, {1.0, 0.0, 0.0})};
    EXPECT_EQ(error_code_of([&] { SimilarityClassifier().classify({1.0, 0.0}, corpus); }),
              ErrorCode::DimensionMismatch);
}

TEST(SimilarityClassifierTest, NearestSitesSortedWithStableTies) {
    const Corpus corpus = {
        site("far", HealthCategory::Degraded, {0.0, 1.0}),
        site("tie_a", HealthCategory::Healthy, {1.0, 1.0}),
        site("exact", HealthCategory::Healthy, {1.0, 0.0}, "Indonesia"),
        site("tie_b", HealthCategory::RestoredMid, {2.0, 2.0}),
    };
    SimilarityClassifier classifier;
    const auto top3 = classifier.nearest_sites({1.0, 0.0}, corpus);
    ASSERT_EQ(top3.size(), 3u);
    EXPECT_EQ(top3[0].siteId, "exact");
    EXPECT_EQ(top3[0].country, "Indonesia");
    EXPECT_NEAR(top3[0].similarity, 1.0, 1e-12);
    EXPECT_EQ(top3[1].siteId, "tie_a");
    EXPECT_EQ(top3[2].siteId, "tie_b");
    EXPECT_EQ(top3[2].category, HealthCategory::RestoredMid);

    EXPECT_EQ(classifier.nearest_sites({1.0, 0.0}, corpus, 10).size(), 4u);
    EXPECT_EQ(classifier.nearest_sites({1.0, 0.0}, corpus, 1).size(), 1u);
}

TEST(ProjectionVisualizerTest, ProjectsHalfMeans) {
    const Projection2D even = ProjectionVisualizer::project({1.0, 2.0, 3.0, 4.0});
    EXPECT_DOUBLE_EQ(even.x, 1.5);
    EXPECT_DOUBLE_EQ(even.y, 3.5);

    const Projection2D odd = ProjectionVisualizer::project({1.0, 2.0, 3.0});
    EXPECT_DOUBLE_EQ(odd.x, 1.0);
    EXPECT_DOUBLE_EQ(odd.y, 2.5);
}

TEST(ProjectionVisualizerTest, DegenerateVectorsProjectToZero) {
    const Projection2D empty = ProjectionVisualizer::project({});
    EXPECT_EQ(empty.x, 0.0);
    EXPECT_EQ(empty.y, 0.0);

    const Projection2D single = ProjectionVisualizer::project({7.0});
    EXPECT_EQ(single.x, 0.0);
    EXPECT_DOUBLE_EQ(single.y, 7.0);
}

TEST(ProjectionVisualizerTest, EmptySitesAmongTheFirstTenAreDropped) {
    Corpus corpus;
    corpus.push_back(site("empty", HealthCategory::Degraded, {}));
    for (int i = 0; i < 12; ++i) {
        corpus.push_back(site("s" + std::to_string(i), HealthCategory::Healthy, {double(i), double(i)}));
    }
    const Visualization v = ProjectionVisualizer().visualize({2.0, 4.0}, corpus);
    EXPECT_DOUBLE_EQ(v.query.x, 2.0);
    EXPECT_DOUBLE_EQ(v.query.y, 4.0);
    ASSERT_EQ(v.referencePoints.size(), 9u);
    EXPECT_EQ(v.referencePoints.front().siteId, "s0");
    EXPECT_EQ(v.referencePoints.back().siteId, "s8");
    EXPECT_DOUBLE_EQ(v.referencePoints[3].position.x, 3.0);
}

TEST(ProjectionVisualizerTest, TakesFirstTenSites) {
    Corpus corpus;
    for (int i = 0; i < 12; ++i) {
        corpus.push_back(site("s" + std::to_string(i), HealthCategory::Healthy, {double(i), 1.0}));
    }
    const Visualization v = ProjectionVisualizer().visualize({0.0, 0.0}, corpus);
    ASSERT_EQ(v.referencePoints.size(), 10u);
    EXPECT_EQ(v.referencePoints.back().siteId, "s9");
    EXPECT_EQ(ProjectionVisualizer().visualize({0.0, 0.0}, corpus, 3).referencePoints.size(), 3u);
}

TEST(ProjectionVisualizerTest, EmptyCorpusHasNoReferencePoints) {
    const Visualization v = ProjectionVisualizer().visualize({1.0, 1.0}, {});
    EXPECT_TRUE(v.referencePoints.empty());
}
