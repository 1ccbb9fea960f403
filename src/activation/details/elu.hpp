#ifndef INSIGHT_ELU_HPP
#define INSIGHT_ELU_HPP
// "Fast and Accurate Deep Network Learning by Exponential Linear Units" https://arxiv.org/abs/1511.07289
#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Insight::Activation::Details {

    struct ELU {
        double alpha{1.0};

        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::elu(std::move(input), alpha);
        }
    };

}

#endif //INSIGHT_ELU_HPP
