#ifndef INSIGHT_DATA_COLLATE_HPP
#define INSIGHT_DATA_COLLATE_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "dataset.hpp"

namespace Insight::Data::Details {
    // inputs: [B, C, T, F, 1]; labels[k]: [B, dim_k], in target order.
    struct Batch {
        torch::Tensor inputs{};
        std::vector<torch::Tensor> labels{};
    };

    struct Stack : public torch::data::transforms::Collation<Batch, std::vector<Sample>> {
        Batch apply_batch(std::vector<Sample> samples) override
        {
            TORCH_CHECK(!samples.empty(), "Cannot collate an empty batch.");
            const auto label_count = samples.front().labels.size();

            std::vector<torch::Tensor> inputs;
            inputs.reserve(samples.size());
            std::vector<std::vector<torch::Tensor>> labels(label_count);
            for (auto& sample : samples) {
                TORCH_CHECK(sample.labels.size() == label_count, "Samples of one batch disagree on their target count.");
                inputs.push_back(std::move(sample.input));
                for (std::size_t k = 0; k < label_count; ++k) {
                    labels[k].push_back(std::move(sample.labels[k]));
                }
            }

            Batch batch{};
            batch.inputs = torch::stack(inputs);
            batch.labels.reserve(label_count);
            for (auto& column : labels) {
                batch.labels.push_back(torch::stack(column));
            }
            return batch;
        }
    };
}

#endif // INSIGHT_DATA_COLLATE_HPP
