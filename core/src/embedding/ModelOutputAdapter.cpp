#include "reefradar/embedding/ModelOutputAdapter.h"
#include "reefradar/Errors.h"

#include <array>

namespace reefradar {
namespace embedding {

namespace {

constexpr std::array<const char*, 4> kPreferredKeys = {"embeddings", "embedding", "output", "output_0"};

const std::vector<float>* find_tensor(const RawModelOutput& output, const std::string& key) {
    for (const auto& [name, values] : output.tensors) {
        if (name == key) return &values;
    }
    return nullptr;
}

}  // namespace

ModelOutputAdapter::ModelOutputAdapter(std::size_t dimension) : dimension_(dimension) {}

std::string ModelOutputAdapter::select_tensor(const RawModelOutput& output) {
    for (const char* key : kPreferredKeys) {
        if (find_tensor(output, key)) return key;
    }
    return output.tensors.empty() ? std::string() : output.tensors.front().first;
}

EmbeddingBatch ModelOutputAdapter::to_batch(const RawModelOutput& output, std::size_t windowCount) const {
    const std::string key = select_tensor(output);
    const std::vector<float>* values = key.empty() ? nullptr : find_tensor(output, key);
    if (!values) {
        throw ReefError(ErrorCode::EmbeddingSourceUnavailable, "Model output contains no tensors");
    }
    if (dimension_ == 0 || values->size() < windowCount * dimension_) {
        throw ReefError(ErrorCode::EmbeddingSourceUnavailable,
                        "Model output '" + key + "' has " + std::to_string(values->size()) + " values, expected " +
                        std::to_string(windowCount * dimension_));
    }

    EmbeddingBatch batch;
    batch.dimension = dimension_;
    batch.embeddings.reserve(windowCount);
    for (std::size_t w = 0; w < windowCount; ++w) {
        const auto begin = values->begin() + static_cast<std::ptrdiff_t>(w * dimension_);
        batch.embeddings.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(dimension_));
    }
    return batch;
}

ModelEmbeddingSource::ModelEmbeddingSource(std::string name, ModelFn model, std::size_t dimension)
    : name_(std::move(name)), model_(std::move(model)), adapter_(dimension) {}

EmbeddingBatch ModelEmbeddingSource::embed(const std::vector<Window>& windows, int sampleRate) {
    if (!model_) {
        throw ReefError(ErrorCode::EmbeddingSourceUnavailable, name_ + ": no model loaded");
    }
    EmbeddingBatch batch;
    batch.dimension = adapter_.dimension();
    batch.embeddings.reserve(windows.size());
    for (const auto& window : windows) {
        auto single = adapter_.to_batch(model_(window, sampleRate), 1);
        batch.embeddings.push_back(std::move(single.embeddings.front()));
    }
    return batch;
}

}  // namespace embedding
}  // namespace reefradar
