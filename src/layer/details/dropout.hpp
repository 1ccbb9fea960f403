#ifndef INSIGHT_DROPOUT_HPP
#define INSIGHT_DROPOUT_HPP
#include "../../activation/activation.hpp"
#include <torch/torch.h>
#include <stdexcept>
#include <string>
#include "../registry.hpp"
namespace Insight::Layer::Details {

    struct DropoutOptions {
        double probability{0.5};
    };

    struct DropoutDescriptor {
        DropoutOptions options{};
        ::Insight::Activation::Descriptor activation{::Insight::Activation::Identity};
    };

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const DropoutDescriptor& descriptor, const std::string& name)
    {
        if (descriptor.options.probability < 0.0 || descriptor.options.probability >= 1.0) {
            throw std::invalid_argument("Dropout probability must be in the range [0, 1).");
        }
        auto module = owner.register_module(name, torch::nn::Dropout(torch::nn::DropoutOptions(descriptor.options.probability)));
        return make_registered_layer(module, descriptor.activation.type, name);
    }


    struct GaussianNoiseOptions {
        /// Noise std relative to the magnitude of each input element.
        double sigma{0.1};
        /// Treat the noise scale as a constant. When false the scale is part of the graph,
        /// which biases the network towards small activations.
        bool relative_detach{true};
    };

    struct GaussianNoiseDescriptor {
        GaussianNoiseOptions options{};
        ::Insight::Activation::Descriptor activation{::Insight::Activation::Identity};
    };

    class GaussianNoiseImpl : public torch::nn::Module {
    public:
        explicit GaussianNoiseImpl(GaussianNoiseOptions options = {})
            : options_(options)
        {
            TORCH_CHECK(options_.sigma >= 0.0, "GaussianNoise sigma must be non-negative.");
        }

        torch::Tensor forward(torch::Tensor input)
        {
            if (!input.defined()) return input;
            TORCH_CHECK(input.is_floating_point(), "GaussianNoise expects floating point tensors.");
            if (!is_training() || options_.sigma == 0.0) return input;

            auto scale = options_.relative_detach ? input.detach() * options_.sigma : input * options_.sigma;
            auto noise = torch::empty_like(input).normal_() * scale;
            return input + noise;
        }

        [[nodiscard]] const GaussianNoiseOptions& options() const noexcept { return options_; }

    private:
        GaussianNoiseOptions options_{};
    };

    TORCH_MODULE(GaussianNoise);

    template <class Owner>
    RegisteredLayer build_registered_layer(Owner& owner, const GaussianNoiseDescriptor& descriptor, const std::string& name)
    {
        auto module = owner.register_module(name, GaussianNoise(descriptor.options));
        return make_registered_layer(module, descriptor.activation.type, name);
    }

}

#endif //INSIGHT_DROPOUT_HPP
