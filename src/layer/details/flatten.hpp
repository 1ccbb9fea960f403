#ifndef INSIGHT_FLATTEN_HPP
#define INSIGHT_FLATTEN_HPP
#include <string>

#include <torch/torch.h>
#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Insight::Layer::Details {

    // [B, D, ...] -> [B, D, prod(...)]: collapses everything after the distributed axis.
    class TimeDistributedFlattenImpl : public torch::nn::Module {
    public:
        TimeDistributedFlattenImpl() = default;

        [[nodiscard]] torch::Tensor forward(torch::Tensor input)
        {
            TORCH_CHECK(input.dim() >= 3,
                        "TimeDistributedFlatten expects at least [batch, distributed, features], got ", input.sizes());
            return input.flatten(2);
        }
    };

    TORCH_MODULE(TimeDistributedFlatten);


    struct TimeDistributedFlattenDescriptor {
        ::Insight::Activation::Descriptor activation{::Insight::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const TimeDistributedFlattenDescriptor& descriptor, const std::string& name)
    {
        auto module = owner.register_module(name, TimeDistributedFlatten());
        return make_registered_layer(module, descriptor.activation.type, name);
    }

}

#endif //INSIGHT_FLATTEN_HPP
