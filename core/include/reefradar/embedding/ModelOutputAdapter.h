#pragma once

#include "EmbeddingSource.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace reefradar {
namespace embedding {

// Named output tensors of one model invocation, flattened row-major.
struct RawModelOutput {
    std::vector<std::pair<std::string, std::vector<float>>> tensors;
};

/**
 * ModelOutputAdapter: the single conversion point from raw model output to
 * the Embedding contract.
 *
 * Tensor selection: the first present of "embeddings", "embedding", "output",
 * "output_0"; otherwise the first tensor. The selected tensor is split into
 * windowCount consecutive vectors of `dimension` values; trailing values are
 * ignored.
 */
class ModelOutputAdapter {
public:
    explicit ModelOutputAdapter(std::size_t dimension);

    /**
     * @throws ReefError(EmbeddingSourceUnavailable) when the output has no
     *         tensors or the selected tensor is too small
     */
    EmbeddingBatch to_batch(const RawModelOutput& output, std::size_t windowCount) const;

    // Name of the tensor to_batch() would read, or empty when there is none.
    static std::string select_tensor(const RawModelOutput& output);

    std::size_t dimension() const { return dimension_; }

private:
    std::size_t dimension_;
};

/**
 * ModelEmbeddingSource: adapts a per-window model callable to EmbeddingSource.
 *
 * The callable is invoked once per window (batch of one) and its raw output
 * goes through ModelOutputAdapter.
 */
class ModelEmbeddingSource : public EmbeddingSource {
public:
    using ModelFn = std::function<RawModelOutput(const Window& window, int sampleRate)>;

    ModelEmbeddingSource(std::string name, ModelFn model, std::size_t dimension);

    EmbeddingBatch embed(const std::vector<Window>& windows, int sampleRate) override;
    std::string name() const override { return name_; }

private:
    std::string name_;
    ModelFn model_;
    ModelOutputAdapter adapter_;
};

}  // namespace embedding
}  // namespace reefradar
