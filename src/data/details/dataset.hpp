#ifndef INSIGHT_DATA_DATASET_HPP
#define INSIGHT_DATA_DATASET_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/options.hpp"
#include "normalization.hpp"
#include "recording.hpp"
#include "region.hpp"
#include "target.hpp"

namespace Insight::Data::Details {
    // input: [channel, time, frequency, 1]; labels: one tensor per configured target.
    struct Sample {
        torch::Tensor input{};
        std::vector<torch::Tensor> labels{};
    };

    /*
     * Windowed sample extractor over one split of a recording.
     *
     * A window starting at `s` covers [s, s + T) with T = model_timesteps. Labels use the
     * last step of the window (s + T - 1) and, for direction and speed, the step before it
     * (s + T - 2), which is the last step of the window shifted back by one.
     *
     * Direction, head_direction and speed labels are computed from the *position* channel:
     * atan2 and Euclidean length of the displacement between those two steps. Their own
     * series in the recording are never read.
     *
     * Sampling: shuffle or random_batches replace the requested index by a uniform draw
     * from the index set on every access. Both toggles trade reproducibility for i.i.d.
     * batches.
     *
     * Region filtering: a window whose position label falls outside the configured region
     * is redrawn. The retry is bounded by max_filter_retries; exhausting it throws
     * std::runtime_error.
     *
     * All state is fixed at construction, so several loader workers may call get()
     * concurrently.
     */
    class WaveletDataset : public torch::data::datasets::Dataset<WaveletDataset, Sample> {
    public:
        WaveletDataset(const Options& options,
                       Recording recording,
                       std::vector<std::int64_t> indices,
                       NormalizationStatistics statistics,
                       Region region = Region::None)
            : recording_(std::move(recording)),
              indices_(std::move(indices)),
              statistics_(std::move(statistics)),
              region_(region),
              sample_size_(options.model_timesteps),
              shuffle_(options.shuffle),
              random_batches_(options.random_batches),
              max_filter_retries_(options.max_filter_retries)
        {
            options.validate();

            if (indices_.empty()) {
                throw std::invalid_argument("A dataset split needs at least one window index.");
            }
            const auto last_start = recording_.length() - sample_size_;
            for (const auto index : indices_) {
                if (index < 0 || index > last_start) {
                    throw std::out_of_range("Window index " + std::to_string(index) + " does not fit a window of "
                                            + std::to_string(sample_size_) + " steps in a recording of "
                                            + std::to_string(recording_.length()) + ".");
                }
            }

            bool needs_position = region_ != Region::None;
            for (const auto& target : options.targets) {
                const auto kind = parse_target_kind(target.name);
                needs_position = needs_position || derived_from_position(kind);
                if (kind == TargetKind::Position && !recording_.has_channel(target.name)) {
                    throw std::invalid_argument("Recording has no '" + target.name + "' channel.");
                }
                kinds_.push_back(kind);
            }

            if (needs_position) {
                const auto& position = recording_.channel(std::string(kPositionChannel));
                if (position.dim() != 2 || position.size(1) < 2) {
                    throw std::invalid_argument("The position channel must be [time, 2] to derive direction, speed or regions.");
                }
                position_ = position;
            }

            const auto& median = statistics_.median;
            if (!median.defined() || median.sizes().vec() != std::vector<std::int64_t>{recording_.frequencies(), recording_.channel_count()}) {
                throw std::invalid_argument("Normalization statistics do not match the recording's [frequency, channel] shape.");
            }
        }

        Sample get(std::size_t index) override
        {
            auto start = resolve(index);
            std::size_t rejected = 0;
            while (!accepts(start)) {
                if (++rejected >= max_filter_retries_) {
                    throw std::runtime_error("Region filter '" + std::string(region_name(region_)) + "' rejected "
                                             + std::to_string(rejected) + " consecutive windows.");
                }
                // A deterministic lookup would return the same window again, so retries always draw.
                start = draw();
            }
            return sample_at(start);
        }

        [[nodiscard]] torch::optional<std::size_t> size() const override
        {
            return indices_.size();
        }

        // Unfiltered sample for the window starting at `start`.
        [[nodiscard]] Sample sample_at(std::int64_t start) const
        {
            Sample sample{};
            sample.input = input_window(start);
            sample.labels.reserve(kinds_.size());

            const auto last = start + sample_size_ - 1;
            for (const auto kind : kinds_) {
                switch (kind) {
                    case TargetKind::Position:
                        sample.labels.push_back(recording_.channel(std::string(kPositionChannel)).select(0, last)
                                                    .reshape({-1}).to(torch::kFloat32));
                        break;
                    case TargetKind::Direction:
                    case TargetKind::HeadDirection: {
                        const auto [dx, dy] = displacement(last);
                        sample.labels.push_back(torch::tensor({static_cast<float>(std::atan2(dy, dx))}));
                        break;
                    }
                    case TargetKind::Speed: {
                        const auto [dx, dy] = displacement(last);
                        sample.labels.push_back(torch::tensor({static_cast<float>(std::hypot(dx, dy))}));
                        break;
                    }
                }
            }
            return sample;
        }

        [[nodiscard]] bool accepts(std::int64_t start) const
        {
            if (region_ == Region::None) {
                return true;
            }
            const auto last = start + sample_size_ - 1;
            const auto position = position_.accessor<double, 2>();
            return accept(region_, position[last][0], position[last][1]);
        }

        // [channel, time, frequency, 1]
        [[nodiscard]] std::vector<std::int64_t> input_shape() const
        {
            return {recording_.channel_count(), sample_size_, recording_.frequencies(), 1};
        }

        [[nodiscard]] const std::vector<std::int64_t>& indices() const noexcept { return indices_; }
        [[nodiscard]] const NormalizationStatistics& statistics() const noexcept { return statistics_; }
        [[nodiscard]] const Recording& recording() const noexcept { return recording_; }
        [[nodiscard]] Region region() const noexcept { return region_; }
        [[nodiscard]] std::int64_t sample_size() const noexcept { return sample_size_; }

    private:
        [[nodiscard]] std::int64_t resolve(std::size_t index) const
        {
            if (shuffle_ || random_batches_) {
                return draw();
            }
            if (index >= indices_.size()) {
                throw std::out_of_range("Sample index " + std::to_string(index) + " is outside a split of "
                                        + std::to_string(indices_.size()) + " windows.");
            }
            return indices_[index];
        }

        [[nodiscard]] std::int64_t draw() const
        {
            static thread_local std::mt19937_64 engine{std::random_device{}()};
            std::uniform_int_distribution<std::size_t> pick(0, indices_.size() - 1);
            return indices_[pick(engine)];
        }

        [[nodiscard]] torch::Tensor input_window(std::int64_t start) const
        {
            auto window = recording_.wavelets().narrow(/*dim=*/0, start, sample_size_);
            return statistics_.apply(window).permute({2, 0, 1}).unsqueeze(-1).contiguous();
        }

        [[nodiscard]] std::pair<double, double> displacement(std::int64_t last) const
        {
            const auto position = position_.accessor<double, 2>();
            return {position[last][0] - position[last - 1][0], position[last][1] - position[last - 1][1]};
        }

        Recording recording_;
        std::vector<std::int64_t> indices_{};
        NormalizationStatistics statistics_{};
        Region region_{Region::None};
        std::vector<TargetKind> kinds_{};
        torch::Tensor position_{};
        std::int64_t sample_size_{};
        bool shuffle_{false};
        bool random_batches_{false};
        std::size_t max_filter_retries_{};
    };
}

#endif // INSIGHT_DATA_DATASET_HPP
