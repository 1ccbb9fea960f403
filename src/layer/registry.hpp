#ifndef INSIGHT_LAYER_REGISTRY_HPP
#define INSIGHT_LAYER_REGISTRY_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "../activation/activation.hpp"
#include "../activation/apply.hpp"

namespace Insight::Layer::Details {
    template <class Impl>
    [[nodiscard]] inline std::shared_ptr<torch::nn::Module>
    to_shared_module_ptr(const torch::nn::ModuleHolder<Impl>& holder)
    {
        static_assert(std::is_base_of_v<torch::nn::Module, Impl>, "ModuleHolder implementation must derive from torch::nn::Module.");
        return std::static_pointer_cast<torch::nn::Module>(holder.ptr());
    }

    // One step of a network: a registered module, its forward entry point and the
    // activation that follows it.
    struct RegisteredLayer {
        struct ForwardBinding {
            using Invoker = torch::Tensor (*)(void*, torch::Tensor);

            Invoker invoke{nullptr};
            void* context{nullptr};

            [[nodiscard]] explicit operator bool() const noexcept { return invoke != nullptr; }

            torch::Tensor operator()(torch::Tensor input) const
            {
                if (!invoke) {
                    throw std::logic_error("Attempted to invoke an empty forward binding.");
                }
                return invoke(context, std::move(input));
            }
        };

        template <class Module>
        void bind_module_forward(Module* module)
        {
            forward = ForwardBinding{&dispatch_module<Module>, module};
        }

        // Module forward followed by the bound activation.
        torch::Tensor operator()(torch::Tensor input) const
        {
            return ::Insight::Activation::Details::apply(activation, forward(std::move(input)));
        }

        [[nodiscard]] bool has_activation() const noexcept
        {
            return activation != ::Insight::Activation::Type::Identity;
        }

        ForwardBinding forward{};
        ::Insight::Activation::Type activation{::Insight::Activation::Type::Identity};
        std::shared_ptr<torch::nn::Module> module{};
        std::string name{};

    private:
        template <class Module>
        static torch::Tensor dispatch_module(void* context, torch::Tensor input)
        {
            auto* module = static_cast<Module*>(context);
            return module->forward(std::move(input));
        }
    };

    template <class Owner, class Descriptor>
    RegisteredLayer build_registered_layer(Owner&, const Descriptor&, const std::string&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported layer descriptor provided to build_registered_layer.");
        return {};
    }

    template <class Owner, class... DescriptorTypes>
    RegisteredLayer build_registered_layer(Owner& owner, const std::variant<DescriptorTypes...>& descriptor, const std::string& name) {
        return std::visit(
            [&](const auto& concrete_descriptor) {
                return build_registered_layer(owner, concrete_descriptor, name);
            },
            descriptor);
    }

    template <class Module>
    [[nodiscard]] RegisteredLayer make_registered_layer(const Module& module, ::Insight::Activation::Type activation, std::string name)
    {
        RegisteredLayer registered_layer{};
        registered_layer.activation = activation;
        registered_layer.module = to_shared_module_ptr(module);
        registered_layer.name = std::move(name);
        registered_layer.bind_module_forward(module.get());
        return registered_layer;
    }
}
#endif // INSIGHT_LAYER_REGISTRY_HPP
