#ifndef INSIGHT_CONV_HPP
#define INSIGHT_CONV_HPP
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "../registry.hpp"
#include "time_distributed.hpp"

namespace Insight::Layer::Details {

    struct Conv2dOptions {
        std::int64_t in_channels{};
        std::int64_t out_channels{};
        std::vector<std::int64_t> kernel_size{3, 3};
        std::vector<std::int64_t> stride{1, 1};
        std::vector<std::int64_t> padding{0, 0};
        bool bias{true};
    };

    // Conv2d applied per slice of dim 1 (see TimeDistributed).
    struct TimeDistributedConv2dDescriptor {
        Conv2dOptions options{};
        ::Insight::Activation::Descriptor activation{::Insight::Activation::Identity};
        ::Insight::Initialization::Descriptor initialization{::Insight::Initialization::KaimingNormal};
    };

    [[nodiscard]] inline torch::nn::Conv2d make_conv2d(const Conv2dOptions& descriptor_options)
    {
        if (descriptor_options.in_channels <= 0 || descriptor_options.out_channels <= 0) {
            throw std::invalid_argument("Conv2d layers require positive channel counts.");
        }
        if (descriptor_options.kernel_size.size() != 2 || descriptor_options.stride.size() != 2
            || descriptor_options.padding.size() != 2) {
            throw std::invalid_argument("Conv2d kernel, stride and padding must each have two entries.");
        }

        auto options = torch::nn::Conv2dOptions(descriptor_options.in_channels,
                                                descriptor_options.out_channels,
                                                descriptor_options.kernel_size)
                           .stride(descriptor_options.stride)
                           .padding(descriptor_options.padding)
                           .bias(descriptor_options.bias);
        return torch::nn::Conv2d(options);
    }

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const TimeDistributedConv2dDescriptor& descriptor, const std::string& name)
    {
        auto conv = make_conv2d(descriptor.options);
        ::Insight::Initialization::Details::apply_module_initialization(*conv, descriptor.initialization);

        auto module = owner.register_module(name, TimeDistributed(torch::nn::AnyModule(conv)));
        return make_registered_layer(module, descriptor.activation.type, name);
    }

}

#endif //INSIGHT_CONV_HPP
