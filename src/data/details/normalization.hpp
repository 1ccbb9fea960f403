#ifndef INSIGHT_DATA_NORMALIZATION_HPP
#define INSIGHT_DATA_NORMALIZATION_HPP

#include <cstdint>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

namespace Insight::Data::Details {
    // Median along dim 0, averaging the two middle values for even counts.
    [[nodiscard]] inline torch::Tensor median_along_first(const torch::Tensor& values)
    {
        TORCH_CHECK(values.dim() >= 1 && values.size(0) > 0, "median requires a non-empty leading axis.");
        const auto count = values.size(0);
        const auto sorted = std::get<0>(values.sort(/*dim=*/0));
        if (count % 2 == 1) {
            return sorted.select(0, count / 2);
        }
        return (sorted.select(0, count / 2 - 1) + sorted.select(0, count / 2)) / 2.0;
    }

    // Robust per-(frequency, channel) centre and scale, estimated from training rows only.
    struct NormalizationStatistics {
        torch::Tensor median{};
        torch::Tensor mad{};

        [[nodiscard]] static NormalizationStatistics estimate(const torch::Tensor& wavelets, const std::vector<std::int64_t>& training_indices)
        {
            if (training_indices.empty()) {
                throw std::invalid_argument("Normalization statistics need at least one training index.");
            }
            TORCH_CHECK(wavelets.dim() == 3, "Wavelets must be [time, frequency, channel], got ", wavelets.sizes());

            const auto index = torch::tensor(training_indices, torch::TensorOptions().dtype(torch::kLong));
            const auto rows = wavelets.index_select(0, index).to(torch::kFloat64);

            NormalizationStatistics statistics{};
            statistics.median = median_along_first(rows);
            statistics.mad = median_along_first((rows - statistics.median).abs());

            if ((statistics.mad == 0).any().item<bool>()) {
                throw std::invalid_argument("Wavelet band has zero median absolute deviation over the training indices; "
                                            "normalising it would produce non-finite inputs.");
            }
            statistics.median = statistics.median.to(torch::kFloat32);
            statistics.mad = statistics.mad.to(torch::kFloat32);
            return statistics;
        }

        // window: [time, frequency, channel], broadcast over time.
        [[nodiscard]] torch::Tensor apply(const torch::Tensor& window) const
        {
            TORCH_CHECK(median.defined() && mad.defined(), "Normalization statistics are not initialised.");
            return (window - median) / mad;
        }
    };
}

#endif // INSIGHT_DATA_NORMALIZATION_HPP
