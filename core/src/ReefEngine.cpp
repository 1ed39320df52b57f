#include "reefradar/ReefEngine.h"
#include "reefradar/CoreContract.h"
#include "reefradar/Log.h"
#include "reefradar/Utility.h"

#include <exception>
#include <utility>

namespace reefradar {

namespace {

constexpr const char* kTag = "engine";

embedding::EmbeddingServiceOptions service_options(const EngineConfig& config) {
    embedding::EmbeddingServiceOptions options;
    options.timeout = config.embedTimeout;
    options.windowsPerCall = config.windowsPerCall;
    options.sampleRate = contract::TARGET_SAMPLE_RATE_HZ;
    options.syntheticDimension = contract::EMBEDDING_DIM;
    return options;
}

}  // namespace

std::string analysis_caveats(bool synthetic) {
    std::string caveats =
        "Classification based on acoustic similarity to reference sites. "
        "Not a definitive health diagnosis. Complements but does not replace visual surveys.";
    if (synthetic) {
        caveats += " (Demo mode: using synthetic embeddings)";
    }
    return caveats;
}

ReefEngine::ReefEngine(EngineConfig config, std::shared_ptr<embedding::EmbeddingSource> source)
    : config_(std::move(config)),
      embeddingService_(std::move(source), service_options(config_)) {
    if (!config_.databasePath.empty()) {
        store_ = std::make_unique<ReferenceStore>(config_.databasePath);
        store_->initialize();
        REEFRADAR_LOG_INFO(kTag, "opened reference store ", config_.databasePath);
    }
}

std::shared_ptr<const Corpus> ReefEngine::corpus() {
    std::lock_guard<std::mutex> lock(corpusMutex_);
    if (!corpus_) {
        auto loaded = std::make_shared<Corpus>();
        if (store_) {
            *loaded = store_->load_reference_sites();
        }
        REEFRADAR_LOG_INFO(kTag, "loaded ", loaded->size(), " reference site(s)");
        corpus_ = std::move(loaded);
    }
    return corpus_;
}

void ReefEngine::reload_corpus() {
    std::shared_ptr<const Corpus> fresh;
    if (store_) {
        fresh = std::make_shared<const Corpus>(store_->load_reference_sites());
    } else {
        fresh = std::make_shared<const Corpus>();
    }
    std::lock_guard<std::mutex> lock(corpusMutex_);
    corpus_ = std::move(fresh);
}

void ReefEngine::set_corpus(Corpus corpus) {
    auto snapshot = std::make_shared<const Corpus>(std::move(corpus));
    std::lock_guard<std::mutex> lock(corpusMutex_);
    corpus_ = std::move(snapshot);
}

ReefEngine::PreparedRecording ReefEngine::prepare_recording(const std::vector<std::uint8_t>& wavBytes) const {
    PreparedRecording rec;
    rec.decoded = codec_.decode(wavBytes);
    REEFRADAR_LOG_DEBUG(kTag, "decoded ", rec.decoded.channelCount, " ch, ", rec.decoded.sampleRate, " Hz, ",
                        rec.decoded.bitDepth, "-bit, ", rec.decoded.duration_seconds(), " s");

    rec.prepared = segmenter_.prepare(rec.decoded);

    auto windows = std::make_shared<const std::vector<Window>>(rec.prepared.windows);
    rec.embedded = embeddingService_.embed(windows);
    rec.mean = aggregator_.aggregate(rec.embedded.embeddings);
    return rec;
}

RecordingEmbedding ReefEngine::embed_recording(const std::vector<std::uint8_t>& wavBytes) const {
    PreparedRecording rec = prepare_recording(wavBytes);
    RecordingEmbedding out;
    out.mean = std::move(rec.mean);
    out.windowCount = rec.prepared.windows.size();
    out.synthetic = rec.embedded.synthetic;
    return out;
}

AnalysisResult ReefEngine::run_pipeline(const AnalysisRequest& request) {
    PreparedRecording rec = prepare_recording(request.audioBytes);

    // Snapshot stays valid for the whole request even if the corpus is reloaded.
    const std::shared_ptr<const Corpus> snapshot = corpus();

    AnalysisResult result;
    result.analysisId = request.analysisId;
    result.uploadId = request.uploadId;

    result.originalSampleRate = rec.decoded.sampleRate;
    result.originalChannels = rec.decoded.channelCount;
    result.originalBitDepth = rec.decoded.bitDepth;
    result.originalDurationSeconds = rec.prepared.nativeDurationSeconds;
    result.processedDurationSeconds = rec.prepared.processedDurationSeconds;
    result.windowCount = rec.prepared.windows.size();

    result.classification = classifier_.classify(rec.mean, *snapshot);
    result.similarSites = classifier_.nearest_sites(rec.mean, *snapshot, config_.topK);
    result.visualization = visualizer_.visualize(rec.mean, *snapshot, config_.maxReferencePoints);

    result.embedding.dimension = rec.mean.size();
    result.embedding.windowCount = rec.embedded.embeddings.size();
    result.embedding.synthetic = rec.embedded.synthetic;

    result.caveats = analysis_caveats(rec.embedded.synthetic);
    result.completedAt = utc_timestamp_now();

    if (config_.emitProcessedAudio || (request.options & AnalyzeEmitProcessedAudio)) {
        result.processedAudio = codec_.encode(contract::TARGET_SAMPLE_RATE_HZ, audio::to_pcm16(rec.prepared.samples));
    }
    return result;
}

void ReefEngine::record_failure(const AnalysisRequest& request, const AnalysisFailure& failure) {
    if (!store_ || (request.options & AnalyzeSkipStore)) return;
    try {
        store_->save_failure(request.analysisId, request.uploadId, failure.code, failure.message);
    } catch (const ReefError& e) {
        REEFRADAR_LOG_ERROR(kTag, "could not record failure of ", request.analysisId, ": ", e.what());
    }
}

AnalysisOutcome ReefEngine::analyze(const AnalysisRequest& request) {
    AnalysisOutcome outcome;
    try {
        outcome.result = run_pipeline(request);
        if (store_ && !(request.options & AnalyzeSkipStore)) {
            store_->save_analysis(outcome.result);
        }
        outcome.status = AnalysisStatus::Complete;
        REEFRADAR_LOG_INFO(kTag, "analysis ", request.analysisId, " complete: ",
                           category_to_string(outcome.result.classification.label), " (",
                           outcome.result.classification.confidence, ")",
                           outcome.result.embedding.synthetic ? " [synthetic]" : "",
                           outcome.result.classification.placeholder ? " [placeholder]" : "");
        return outcome;
    } catch (const ReefError& e) {
        outcome.error = AnalysisFailure{.code = e.code(), .message = e.what()};
    } catch (const std::exception& e) {
        outcome.error = AnalysisFailure{.code = ErrorCode::ProcessingFailed,
                                        .message = std::string("Processing failed: ") + e.what()};
    }

    outcome.status = AnalysisStatus::Failed;
    outcome.result = AnalysisResult{};
    if (is_user_error(outcome.error.code)) {
        REEFRADAR_LOG_INFO(kTag, "analysis ", request.analysisId, " rejected: ",
                           error_code_to_string(outcome.error.code), ": ", outcome.error.message);
    } else {
        REEFRADAR_LOG_ERROR(kTag, "analysis ", request.analysisId, " failed: ",
                            error_code_to_string(outcome.error.code), ": ", outcome.error.message);
    }
    record_failure(request, outcome.error);
    return outcome;
}

}  // namespace reefradar
