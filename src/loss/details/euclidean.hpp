#ifndef INSIGHT_LOSS_EUCLIDEAN_HPP
#define INSIGHT_LOSS_EUCLIDEAN_HPP

#include <torch/torch.h>

#include "reduction.hpp"

namespace Insight::Loss::Details {
    struct EuclideanOptions {
        Reduction reduction{Reduction::Mean};
        // Keeps the sqrt differentiable at a perfect prediction.
        double epsilon{1e-12};
    };

    struct EuclideanDescriptor {
        EuclideanOptions options{};
    };

    // L2 distance over the last axis, one value per sample.
    inline torch::Tensor compute(const EuclideanDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        const auto aligned = align_target(prediction, target);
        TORCH_CHECK(prediction.sizes() == aligned.sizes(),
                    "Euclidean loss expects matching shapes, got ", prediction.sizes(), " and ", aligned.sizes());
        auto squared = (prediction - aligned).pow(2);
        auto distance = prediction.dim() == 0
            ? squared.clamp_min(descriptor.options.epsilon).sqrt()
            : squared.sum(-1).clamp_min(descriptor.options.epsilon).sqrt();
        return apply_reduction(distance, descriptor.options.reduction);
    }
}

#endif // INSIGHT_LOSS_EUCLIDEAN_HPP
