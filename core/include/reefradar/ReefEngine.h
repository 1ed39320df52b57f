#pragma once

#include "reefradar/EngineConfig.h"
#include "reefradar/Errors.h"
#include "reefradar/ReefTypes.h"
#include "reefradar/ReferenceStore.h"
#include "reefradar/audio/Segmenter.h"
#include "reefradar/audio/WavCodec.h"
#include "reefradar/classify/ProjectionVisualizer.h"
#include "reefradar/classify/SimilarityClassifier.h"
#include "reefradar/embedding/EmbeddingAggregator.h"
#include "reefradar/embedding/EmbeddingService.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace reefradar {

struct AnalysisFailure {
    ErrorCode code{ErrorCode::ProcessingFailed};
    std::string message;
};

// Tagged result of one analysis: `result` is meaningful only when complete,
// `error` only when failed.
struct AnalysisOutcome {
    AnalysisStatus status{AnalysisStatus::Failed};
    AnalysisResult result;
    AnalysisFailure error;

    bool complete() const { return status == AnalysisStatus::Complete; }
};

// Mean embedding of one recording, as stored for a reference site.
struct RecordingEmbedding {
    Embedding mean;
    std::size_t windowCount{0};
    bool synthetic{false};
};

/**
 * ReefEngine: complete acoustic health analysis pipeline
 *
 * Orchestrates: Decode → Segment → Embed → Aggregate → Classify → Project → Storage
 *
 * Components throw ReefError; analyze() converts every failure into a failed
 * AnalysisOutcome and never throws. The reference corpus is loaded from the
 * store on first use and kept as an immutable snapshot until reload_corpus()
 * or set_corpus() replaces it; requests in flight keep the snapshot they
 * started with.
 */
class ReefEngine {
  public:
    /**
     * @param config Runtime options; a non-empty databasePath opens and
     *        initializes the store
     * @param source Learned embedding model; nullptr always uses synthetic
     *        embeddings
     * @throws ReefError(StorageFailure) when the database cannot be opened
     */
    explicit ReefEngine(EngineConfig config, std::shared_ptr<embedding::EmbeddingSource> source = nullptr);

    AnalysisOutcome analyze(const AnalysisRequest& request);

    /**
     * Decode, segment and embed a recording without classifying it.
     * @throws ReefError on invalid or out-of-bounds audio
     */
    RecordingEmbedding embed_recording(const std::vector<std::uint8_t>& wavBytes) const;

    std::shared_ptr<const Corpus> corpus();
    void reload_corpus();
    void set_corpus(Corpus corpus);

    // nullptr when no database is configured.
    ReferenceStore* store() { return store_.get(); }

    const EngineConfig& config() const { return config_; }

  private:
    struct PreparedRecording {
        AudioBuffer decoded;
        audio::PreparedAudio prepared;
        embedding::EmbeddingOutcome embedded;
        Embedding mean;
    };

    PreparedRecording prepare_recording(const std::vector<std::uint8_t>& wavBytes) const;
    AnalysisResult run_pipeline(const AnalysisRequest& request);
    void record_failure(const AnalysisRequest& request, const AnalysisFailure& failure);

    EngineConfig config_;

    audio::WavCodec codec_;
    audio::Segmenter segmenter_;
    embedding::EmbeddingService embeddingService_;
    embedding::EmbeddingAggregator aggregator_;
    classify::SimilarityClassifier classifier_;
    classify::ProjectionVisualizer visualizer_;

    std::unique_ptr<ReferenceStore> store_;

    std::mutex corpusMutex_;
    std::shared_ptr<const Corpus> corpus_;
};

// User-facing caveats attached to every complete result.
std::string analysis_caveats(bool synthetic);

}  // namespace reefradar
