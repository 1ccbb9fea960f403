#ifndef INSIGHT_REGULARIZATION_HPP
#define INSIGHT_REGULARIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <vector>

#include <torch/torch.h>

#include "details/similarity.hpp"

namespace Insight::Regularization {

    using SimilarityOptions = Details::SimilarityOptions;
    using SimilarityDescriptor = Details::SimilarityDescriptor;

    [[nodiscard]] constexpr auto Similarity(const SimilarityOptions& options = {}) noexcept -> SimilarityDescriptor {
        return {options};
    }

    [[nodiscard]] inline torch::Tensor penalty(const SimilarityDescriptor& descriptor, const std::vector<torch::Tensor>& features) {
        return Details::penalty(descriptor, features);
    }

}

#endif // INSIGHT_REGULARIZATION_HPP
