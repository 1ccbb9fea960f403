#ifndef INSIGHT_PERMUTE_HPP
#define INSIGHT_PERMUTE_HPP
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>
#include "../../activation/activation.hpp"
#include "../registry.hpp"

namespace Insight::Layer::Details {

    struct PermuteOptions {
        std::vector<std::int64_t> dims{};
    };

    class PermuteImpl : public torch::nn::Module {
    public:
        explicit PermuteImpl(PermuteOptions options)
            : options_(std::move(options))
        {
            TORCH_CHECK(!options_.dims.empty(), "Permute requires at least one dimension.");
        }

        [[nodiscard]] torch::Tensor forward(torch::Tensor input)
        {
            TORCH_CHECK(input.dim() == static_cast<std::int64_t>(options_.dims.size()),
                        "Permute expects a rank-", options_.dims.size(), " tensor, got ", input.sizes());
            return input.permute(options_.dims);
        }

        [[nodiscard]] const PermuteOptions& options() const noexcept { return options_; }

    private:
        PermuteOptions options_{};
    };

    TORCH_MODULE(Permute);

    struct PermuteDescriptor {
        PermuteOptions options{};
        ::Insight::Activation::Descriptor activation{::Insight::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const PermuteDescriptor& descriptor, const std::string& name)
    {
        auto module = owner.register_module(name, Permute(descriptor.options));
        return make_registered_layer(module, descriptor.activation.type, name);
    }

}

#endif //INSIGHT_PERMUTE_HPP
