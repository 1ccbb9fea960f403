#ifndef INSIGHT_LOSS_MAE_HPP
#define INSIGHT_LOSS_MAE_HPP

#include <torch/torch.h>

#include "reduction.hpp"

namespace Insight::Loss::Details {
    struct MAEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MAEDescriptor {
        MAEOptions options{};
    };

    inline torch::Tensor compute(const MAEDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        return torch::nn::functional::l1_loss(prediction, align_target(prediction, target),
            torch::nn::functional::L1LossFuncOptions().reduction(
                to_torch_reduction<torch::nn::functional::L1LossFuncOptions>(descriptor.options.reduction)));
    }

}

#endif // INSIGHT_LOSS_MAE_HPP
