#ifndef INSIGHT_LAYER_HPP
#define INSIGHT_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstdint>
#include <variant>
#include <utility>
#include <vector>

#include "details/conv.hpp"
#include "details/dropout.hpp"
#include "details/fc.hpp"
#include "details/flatten.hpp"
#include "details/permute.hpp"
#include "details/time_distributed.hpp"

#include "registry.hpp"

namespace Insight::Layer {
    using RegisteredLayer = Details::RegisteredLayer;

    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;

    using Conv2dOptions = Details::Conv2dOptions;
    using TimeDistributedConv2dDescriptor = Details::TimeDistributedConv2dDescriptor;

    using DropoutOptions = Details::DropoutOptions;
    using DropoutDescriptor = Details::DropoutDescriptor;

    using GaussianNoiseOptions = Details::GaussianNoiseOptions;
    using GaussianNoiseDescriptor = Details::GaussianNoiseDescriptor;

    using PermuteOptions = Details::PermuteOptions;
    using PermuteDescriptor = Details::PermuteDescriptor;

    using TimeDistributedFlattenDescriptor = Details::TimeDistributedFlattenDescriptor;

    using TimeDistributed = Details::TimeDistributed;
    using TimeDistributedFlatten = Details::TimeDistributedFlatten;
    using GaussianNoise = Details::GaussianNoise;
    using Permute = Details::Permute;

    using Descriptor = std::variant<FCDescriptor,
                                    TimeDistributedConv2dDescriptor,
                                    DropoutDescriptor,
                                    GaussianNoiseDescriptor,
                                    PermuteDescriptor,
                                    TimeDistributedFlattenDescriptor>;

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Insight::Activation::Descriptor activation = ::Insight::Activation::Identity,
                                 ::Insight::Initialization::Descriptor initialization = ::Insight::Initialization::KaimingNormal) -> FCDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto TimeDistributedConv2d(const Conv2dOptions& options,
                                                    ::Insight::Activation::Descriptor activation = ::Insight::Activation::Identity,
                                                    ::Insight::Initialization::Descriptor initialization = ::Insight::Initialization::KaimingNormal) -> TimeDistributedConv2dDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto Dropout(const DropoutOptions& options = {}) -> DropoutDescriptor {
        return {options, ::Insight::Activation::Identity};
    }

    [[nodiscard]] inline auto Noise(const GaussianNoiseOptions& options = {}) -> GaussianNoiseDescriptor {
        return {options, ::Insight::Activation::Identity};
    }

    [[nodiscard]] inline auto Transpose(std::vector<std::int64_t> dims) -> PermuteDescriptor {
        return {PermuteOptions{std::move(dims)}, ::Insight::Activation::Identity};
    }

    [[nodiscard]] inline auto Flatten() -> TimeDistributedFlattenDescriptor {
        return {::Insight::Activation::Identity};
    }
}

#endif //INSIGHT_LAYER_HPP
