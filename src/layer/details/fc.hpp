#ifndef INSIGHT_FC_HPP
#define INSIGHT_FC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include <torch/nn/module.h>
#include <torch/nn/options/linear.h>
#include "../../activation/activation.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"


namespace Insight::Layer::Details {
    struct FCOptions {
        std::int64_t in_features{};
        std::int64_t out_features{};
        bool bias{true};
    };

    struct FCDescriptor {
        FCOptions options;
        ::Insight::Activation::Descriptor activation{::Insight::Activation::Identity};
        ::Insight::Initialization::Descriptor initialization{::Insight::Initialization::KaimingNormal};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const FCDescriptor& descriptor, const std::string& name)
    {
        if (descriptor.options.in_features <= 0 || descriptor.options.out_features <= 0) {
            throw std::invalid_argument("Fully connected layers require positive in/out features.");
        }

        auto options = torch::nn::LinearOptions(descriptor.options.in_features, descriptor.options.out_features)
                            .bias(descriptor.options.bias);
        auto module = owner.register_module(name, torch::nn::Linear(options));
        ::Insight::Initialization::Details::apply_module_initialization(*module, descriptor.initialization);
        return make_registered_layer(module, descriptor.activation.type, name);
    }
}

#endif //INSIGHT_FC_HPP
