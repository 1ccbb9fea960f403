#ifndef INSIGHT_REGULARIZATION_DETAILS_SIMILARITY_HPP
#define INSIGHT_REGULARIZATION_DETAILS_SIMILARITY_HPP

#include <cstddef>
#include <vector>

#include <torch/torch.h>

namespace Insight::Regularization::Details {

    struct SimilarityOptions {
        double coefficient{1.0};
        double epsilon{1e-8};
    };

    struct SimilarityDescriptor {
        SimilarityOptions options{};
    };

    // Sum over unordered head pairs (i < j) of sum |cos(f_i, f_j)| along the feature axis.
    // Symmetric in its inputs, non-negative, and zero for fewer than two heads.
    [[nodiscard]] inline torch::Tensor penalty(const SimilarityDescriptor& descriptor, const std::vector<torch::Tensor>& features)
    {
        const auto& options = descriptor.options;
        if (features.empty()) {
            return torch::zeros({});
        }
        auto total = features.front().new_zeros({});
        if (options.coefficient == 0.0) {
            return total;
        }

        for (std::size_t i = 0; i < features.size(); ++i) {
            for (std::size_t j = i + 1; j < features.size(); ++j) {
                TORCH_CHECK(features[i].sizes() == features[j].sizes(),
                            "Head features differ in shape: ", features[i].sizes(), " vs ", features[j].sizes());
                auto cosine = torch::nn::functional::cosine_similarity(
                    features[i], features[j],
                    torch::nn::functional::CosineSimilarityFuncOptions().dim(-1).eps(options.epsilon));
                total = total + cosine.abs().sum();
            }
        }
        return total.mul(options.coefficient);
    }

}

#endif // INSIGHT_REGULARIZATION_DETAILS_SIMILARITY_HPP
