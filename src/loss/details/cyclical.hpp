#ifndef INSIGHT_LOSS_CYCLICAL_HPP
#define INSIGHT_LOSS_CYCLICAL_HPP

#include <numbers>

#include <torch/torch.h>

#include "reduction.hpp"

namespace Insight::Loss::Details {
    struct CyclicalMAEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct CyclicalMAEDescriptor {
        CyclicalMAEOptions options{};
    };

    // Absolute angular error in radians, wrapped so that -pi and pi are the same heading.
    inline torch::Tensor compute(const CyclicalMAEDescriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        constexpr double two_pi = 2.0 * std::numbers::pi;
        const auto delta = prediction - align_target(prediction, target);
        auto error = torch::minimum(delta.abs(), torch::minimum((delta + two_pi).abs(), (delta - two_pi).abs()));
        return apply_reduction(error, descriptor.options.reduction);
    }
}

#endif // INSIGHT_LOSS_CYCLICAL_HPP
