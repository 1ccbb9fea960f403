#ifndef INSIGHT_ACTIVATION_PARSE_HPP
#define INSIGHT_ACTIVATION_PARSE_HPP

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../activation.hpp"

namespace Insight::Activation::Details {
    // Accepts the torch module spelling used in configuration files ("ELU", "LeakyReLU", ...).
    [[nodiscard]] inline Descriptor parse(std::string_view name)
    {
        std::string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

        if (lowered == "identity" || lowered == "linear") return ::Insight::Activation::Identity;
        if (lowered == "relu") return ::Insight::Activation::ReLU;
        if (lowered == "elu") return ::Insight::Activation::ELU;
        if (lowered == "leakyrelu" || lowered == "leaky_relu") return ::Insight::Activation::LeakyReLU;
        if (lowered == "sigmoid") return ::Insight::Activation::Sigmoid;
        if (lowered == "tanh") return ::Insight::Activation::Tanh;
        if (lowered == "gelu") return ::Insight::Activation::GeLU;
        if (lowered == "silu") return ::Insight::Activation::SiLU;

        throw std::invalid_argument("Unknown activation function: '" + std::string(name) + "'.");
    }
}

#endif //INSIGHT_ACTIVATION_PARSE_HPP
