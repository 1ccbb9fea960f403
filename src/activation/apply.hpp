#ifndef INSIGHT_ACTIVATION_APPLY_HPP
#define INSIGHT_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <utility>

#include "activation.hpp"
#include "details/elu.hpp"
#include "details/parse.hpp"

namespace Insight::Activation::Details {
    inline torch::Tensor apply(::Insight::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Insight::Activation::Type::ReLU:
                return torch::relu(std::move(input));
            case ::Insight::Activation::Type::ELU:
                return ELU{}(std::move(input));
            case ::Insight::Activation::Type::LeakyReLU:
                return torch::leaky_relu(std::move(input));
            case ::Insight::Activation::Type::Sigmoid:
                return torch::sigmoid(std::move(input));
            case ::Insight::Activation::Type::Tanh:
                return torch::tanh(std::move(input));
            case ::Insight::Activation::Type::GeLU:
                return torch::gelu(std::move(input));
            case ::Insight::Activation::Type::SiLU:
                return torch::silu(std::move(input));
            case ::Insight::Activation::Type::Identity:
            default:
                return input;
        }
    }
}
#endif // INSIGHT_ACTIVATION_APPLY_HPP
