#ifndef INSIGHT_DATA_RECORDING_HPP
#define INSIGHT_DATA_RECORDING_HPP

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Insight::Data::Details {
    struct Channel {
        std::string name{};
        torch::Tensor values{};
    };

    // Wavelet array [time, frequency, channel] plus behavioral series aligned on time.
    // Immutable once built: copies share tensor storage.
    class Recording {
    public:
        Recording(torch::Tensor wavelets, std::vector<Channel> channels)
        {
            if (!wavelets.defined() || wavelets.dim() != 3) {
                throw std::invalid_argument("Wavelets must be a [time, frequency, channel] tensor.");
            }
            if (wavelets.size(0) == 0 || wavelets.size(1) == 0 || wavelets.size(2) == 0) {
                throw std::invalid_argument("Wavelets must not have an empty axis.");
            }
            wavelets_ = wavelets.to(torch::kCPU, torch::kFloat32).contiguous();

            for (auto& channel : channels) {
                if (!channel.values.defined() || channel.values.dim() < 1) {
                    throw std::invalid_argument("Channel '" + channel.name + "' must be a [time, ...] tensor.");
                }
                if (channel.values.size(0) != length()) {
                    throw std::invalid_argument("Channel '" + channel.name + "' has " + std::to_string(channel.values.size(0))
                                                + " samples, wavelets have " + std::to_string(length()) + ".");
                }
                if (has_channel(channel.name)) {
                    throw std::invalid_argument("Channel '" + channel.name + "' is defined twice.");
                }
                channels_.push_back(Channel{channel.name, channel.values.to(torch::kCPU, torch::kFloat64).contiguous()});
            }
        }

        [[nodiscard]] const torch::Tensor& wavelets() const noexcept { return wavelets_; }
        [[nodiscard]] std::int64_t length() const { return wavelets_.size(0); }
        [[nodiscard]] std::int64_t frequencies() const { return wavelets_.size(1); }
        [[nodiscard]] std::int64_t channel_count() const { return wavelets_.size(2); }
        [[nodiscard]] const std::vector<Channel>& channels() const noexcept { return channels_; }

        [[nodiscard]] bool has_channel(const std::string& name) const
        {
            return std::any_of(channels_.begin(), channels_.end(),
                               [&](const Channel& channel) { return channel.name == name; });
        }

        [[nodiscard]] const torch::Tensor& channel(const std::string& name) const
        {
            for (const auto& channel : channels_) {
                if (channel.name == name) {
                    return channel.values;
                }
            }
            throw std::invalid_argument("Recording has no channel named '" + name + "'.");
        }

    private:
        torch::Tensor wavelets_{};
        std::vector<Channel> channels_{};
    };
}

#endif // INSIGHT_DATA_RECORDING_HPP
