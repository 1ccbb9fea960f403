#ifndef INSIGHT_LOSS_HPP
#define INSIGHT_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../common/options.hpp"
#include "details/reduction.hpp"
#include "details/euclidean.hpp"
#include "details/cyclical.hpp"
#include "details/mae.hpp"
#include "details/mse.hpp"

namespace Insight::Loss {
    using Reduction = Details::Reduction;

    using Descriptor = std::variant<
        Details::EuclideanDescriptor,
        Details::CyclicalMAEDescriptor,
        Details::MAEDescriptor,
        Details::MSEDescriptor>;

    [[nodiscard]] constexpr auto Euclidean(const Details::EuclideanOptions& options = {}) noexcept -> Details::EuclideanDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto CyclicalMAE(const Details::CyclicalMAEOptions& options = {}) noexcept -> Details::CyclicalMAEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto MAE(const Details::MAEOptions& options = {}) noexcept -> Details::MAEDescriptor {
        return {options};
    }

    [[nodiscard]] constexpr auto MSE(const Details::MSEOptions& options = {}) noexcept -> Details::MSEDescriptor {
        return {options};
    }

    // Names accepted in the "loss_functions" configuration mapping.
    [[nodiscard]] inline Descriptor from_name(std::string_view name) {
        if (name == "euclidean") return Euclidean();
        if (name == "cyclical_mae_rad") return CyclicalMAE();
        if (name == "mae") return MAE();
        if (name == "mse") return MSE();
        throw std::invalid_argument("Unknown loss function: '" + std::string(name) + "'.");
    }

    [[nodiscard]] inline torch::Tensor compute(const Descriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        return std::visit([&](const auto& concrete) { return Details::compute(concrete, prediction, target); }, descriptor);
    }

    // One descriptor per target, in target order. Every target must name a loss.
    [[nodiscard]] inline std::vector<Descriptor> from_options(const Options& options) {
        std::vector<Descriptor> descriptors;
        descriptors.reserve(options.targets.size());
        for (const auto& target : options.targets) {
            if (target.loss.empty()) {
                throw std::invalid_argument("Output target '" + target.name + "' has no entry in 'loss_functions'.");
            }
            descriptors.push_back(from_name(target.loss));
        }
        return descriptors;
    }

    // sum_k weight_k * loss_k(predictions[k], labels[k])
    [[nodiscard]] inline torch::Tensor weighted_sum(const Options& options,
                                                    const std::vector<Descriptor>& descriptors,
                                                    const std::vector<torch::Tensor>& predictions,
                                                    const std::vector<torch::Tensor>& labels) {
        const auto count = options.targets.size();
        if (count == 0 || descriptors.size() != count || predictions.size() != count || labels.size() != count) {
            throw std::invalid_argument("Weighted loss needs one descriptor, prediction and label per target ("
                                        + std::to_string(count) + ").");
        }
        auto total = torch::zeros({}, predictions.front().options());
        for (std::size_t k = 0; k < count; ++k) {
            total = total + compute(descriptors[k], predictions[k], labels[k]) * options.targets[k].weight;
        }
        return total;
    }
}

#endif // INSIGHT_LOSS_HPP
