#include "reefradar/embedding/EmbeddingService.h"
#include "reefradar/Errors.h"
#include "reefradar/Log.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <thread>

namespace reefradar {
namespace embedding {

namespace {

constexpr const char* kTag = "embedding";

enum WorkerState : int { Running = 0, Finished = 1, Abandoned = 2 };

struct Chunk {
    std::size_t begin{0};
    std::size_t end{0};
};

std::vector<Chunk> plan_chunks(std::size_t count, std::size_t perCall) {
    std::vector<Chunk> chunks;
    if (count == 0) return chunks;
    if (perCall == 0 || perCall >= count) {
        chunks.push_back(Chunk{.begin = 0, .end = count});
        return chunks;
    }
    for (std::size_t b = 0; b < count; b += perCall) {
        chunks.push_back(Chunk{.begin = b, .end = std::min(count, b + perCall)});
    }
    return chunks;
}

void validate_batch(const EmbeddingBatch& batch, std::size_t expectedCount) {
    if (batch.embeddings.size() != expectedCount) {
        throw ReefError(ErrorCode::EmbeddingSourceUnavailable,
                        "source returned " + std::to_string(batch.embeddings.size()) + " embeddings for " +
                        std::to_string(expectedCount) + " windows");
    }
    if (batch.dimension == 0) {
        throw ReefError(ErrorCode::EmbeddingSourceUnavailable, "source reported dimension 0");
    }
    for (const auto& e : batch.embeddings) {
        if (e.size() != batch.dimension) {
            throw ReefError(ErrorCode::EmbeddingSourceUnavailable,
                            "source returned a vector of length " + std::to_string(e.size()) +
                            " in a batch of dimension " + std::to_string(batch.dimension));
        }
    }
}

}  // namespace

EmbeddingService::EmbeddingService(std::shared_ptr<EmbeddingSource> source, EmbeddingServiceOptions options)
    : source_(std::move(source)),
      options_(options),
      synthetic_(options.syntheticDimension, options.sampleRate),
      stalledWorkers_(std::make_shared<std::atomic<std::size_t>>(0)) {}

std::size_t EmbeddingService::stalled_workers() const {
    return stalledWorkers_->load();
}

std::vector<Embedding> EmbeddingService::call_source(const std::shared_ptr<const std::vector<Window>>& windows) const {
    const auto chunks = plan_chunks(windows->size(), options_.windowsPerCall);
    const bool wholeBatch = chunks.size() == 1;

    std::vector<std::future<EmbeddingBatch>> futures;
    std::vector<std::shared_ptr<std::atomic<int>>> states;
    futures.reserve(chunks.size());
    states.reserve(chunks.size());
    for (const Chunk chunk : chunks) {
        auto promise = std::make_shared<std::promise<EmbeddingBatch>>();
        auto state = std::make_shared<std::atomic<int>>(Running);
        futures.push_back(promise->get_future());
        states.push_back(state);

        // Workers hold shared ownership of their inputs; an abandoned worker may outlive this call.
        std::thread([source = source_, windows, chunk, wholeBatch, rate = options_.sampleRate, promise, state,
                     stalled = stalledWorkers_]() {
            EmbeddingBatch batch;
            std::exception_ptr error;
            try {
                if (wholeBatch) {
                    batch = source->embed(*windows, rate);
                } else {
                    const std::vector<Window> part(windows->begin() + static_cast<std::ptrdiff_t>(chunk.begin),
                                                   windows->begin() + static_cast<std::ptrdiff_t>(chunk.end));
                    batch = source->embed(part, rate);
                }
            } catch (...) {
                error = std::current_exception();
            }
            // Marked finished before the result is published.
            if (state->exchange(Finished) == Abandoned) stalled->fetch_sub(1);
            if (error) {
                promise->set_exception(error);
            } else {
                promise->set_value(std::move(batch));
            }
        }).detach();
    }

    const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    std::vector<Embedding> embeddings;
    embeddings.reserve(windows->size());
    try {
        std::size_t dimension = 0;
        for (std::size_t c = 0; c < chunks.size(); ++c) {
            if (futures[c].wait_until(deadline) != std::future_status::ready) {
                throw ReefError(ErrorCode::EmbeddingSourceUnavailable,
                                "timed out after " + std::to_string(options_.timeout.count()) + " ms");
            }
            EmbeddingBatch batch = futures[c].get();
            validate_batch(batch, chunks[c].end - chunks[c].begin);
            if (dimension != 0 && batch.dimension != dimension) {
                throw ReefError(ErrorCode::EmbeddingSourceUnavailable, "chunks returned different dimensions");
            }
            dimension = batch.dimension;
            for (auto& e : batch.embeddings) embeddings.push_back(std::move(e));
        }
    } catch (...) {
        // Workers still inside the source count as stalled until they return.
        for (const auto& state : states) {
            stalledWorkers_->fetch_add(1);
            int expected = Running;
            if (!state->compare_exchange_strong(expected, Abandoned)) stalledWorkers_->fetch_sub(1);
        }
        throw;
    }
    return embeddings;
}

std::vector<Embedding> EmbeddingService::synthesize_all(const std::vector<Window>& windows) const {
    std::vector<Embedding> out;
    out.reserve(windows.size());
    for (const auto& w : windows) out.push_back(synthetic_.synthesize(w));
    return out;
}

EmbeddingOutcome EmbeddingService::embed(std::shared_ptr<const std::vector<Window>> windows) const {
    EmbeddingOutcome outcome;
    if (!windows || windows->empty()) return outcome;

    if (source_ && stalled_workers() > 0) {
        outcome.fallbackReason = source_->name() + ": previous embedding call still in flight";
    } else if (source_) {
        try {
            outcome.embeddings = call_source(windows);
            REEFRADAR_LOG_INFO(kTag, "received ", outcome.embeddings.size(), " embedding(s) from ", source_->name());
            return outcome;
        } catch (const std::exception& e) {
            outcome.fallbackReason = source_->name() + ": " + e.what();
        }
    } else {
        outcome.fallbackReason = "no embedding source configured";
    }

    REEFRADAR_LOG_WARN(kTag, "embedding source unavailable (", outcome.fallbackReason,
                       "), using synthetic embeddings");
    outcome.synthetic = true;
    outcome.embeddings = synthesize_all(*windows);
    return outcome;
}

}  // namespace embedding
}  // namespace reefradar
