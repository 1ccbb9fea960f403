#ifndef INSIGHT_LOSS_MSE_HPP
#define INSIGHT_LOSS_MSE_HPP

#include <torch/torch.h>

#include "reduction.hpp"

namespace Insight::Loss::Details {

    namespace F = torch::nn::functional;

    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };

    inline torch::Tensor compute(const MSEDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        return F::mse_loss(
            prediction,
            align_target(prediction, target),
            F::MSELossFuncOptions().reduction(to_torch_reduction<F::MSELossFuncOptions>(descriptor.options.reduction))
        );
    }

}

#endif // INSIGHT_LOSS_MSE_HPP
