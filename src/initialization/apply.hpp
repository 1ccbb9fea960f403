#ifndef INSIGHT_INITIALIZATION_APPLY_HPP
#define INSIGHT_INITIALIZATION_APPLY_HPP
#include <torch/torch.h>

#include "initialization.hpp"

namespace Insight::Initialization::Details {
    namespace detail {
        // Parameter handles share storage with the module, so in-place init on the copy is enough.
        [[nodiscard]] inline torch::Tensor own_parameter(torch::nn::Module& module, const char* name) {
            const auto parameters = module.named_parameters(/*recurse=*/false);
            if (const auto* parameter = parameters.find(name)) {
                return *parameter;
            }
            return {};
        }

        inline void zero_bias_if_present(torch::nn::Module& module) {
            auto bias = own_parameter(module, "bias");
            if (bias.defined()) {
                torch::nn::init::zeros_(bias);
            }
        }

        [[nodiscard]] inline torch::Tensor weight_if_present(torch::nn::Module& module) {
            auto weight = own_parameter(module, "weight");
            if (!weight.defined() || weight.dim() < 2) {
                return {};
            }
            return weight;
        }
    }  // namespace detail

    // Initialises the parameters owned directly by `module` (not its children).
    // Default keeps torch's own initialisation.
    inline void apply_module_initialization(torch::nn::Module& module, const Descriptor& descriptor) {
        torch::NoGradGuard guard;

        switch (descriptor.type) {
            case ::Insight::Initialization::Type::KaimingNormal:
                if (auto weight = detail::weight_if_present(module); weight.defined()) {
                    torch::nn::init::kaiming_normal_(weight,
                                                     /*a=*/0.0,
                                                     torch::kFanIn,
                                                     torch::kReLU);
                }
                detail::zero_bias_if_present(module);
                break;
            case ::Insight::Initialization::Type::Default:
            default:
                break;
        }
    }
}
#endif // INSIGHT_INITIALIZATION_APPLY_HPP
