#ifndef INSIGHT_DATA_GENERATION_HPP
#define INSIGHT_DATA_GENERATION_HPP

#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "recording.hpp"
#include "target.hpp"

namespace Insight::Data::Details {
    struct SyntheticOptions {
        std::int64_t length{1024};
        std::int64_t frequencies{16};
        std::int64_t channels{4};
        double step_x{1.0};
        double step_y{0.0};
        double origin_x{0.0};
        double origin_y{0.0};
        // Amplitude of the position signal mixed into every band on top of unit noise.
        double coupling{0.5};
        std::uint64_t seed{42};
    };

    /*
     * Straight-line trajectory with constant step plus Gaussian wavelet power.
     * Channels: "position" [T, 2], "direction" [T, 1], "head_direction" [T, 1] and "speed" [T, 1].
     * Band (f, c) carries coupling * sin(x / (f + 1) + c) so a decoder has something to learn.
     */
    [[nodiscard]] inline Recording Synthetic(const SyntheticOptions& options = {})
    {
        if (options.length <= 0 || options.frequencies <= 0 || options.channels <= 0) {
            throw std::invalid_argument("Synthetic recordings need positive length, frequency and channel counts.");
        }

        std::mt19937 engine(static_cast<std::mt19937::result_type>(options.seed));
        std::normal_distribution<float> noise(0.0f, 1.0f);

        auto wavelets = torch::empty({options.length, options.frequencies, options.channels}, torch::kFloat32);
        auto position = torch::empty({options.length, 2}, torch::kFloat64);
        auto w = wavelets.accessor<float, 3>();
        auto p = position.accessor<double, 2>();

        for (std::int64_t t = 0; t < options.length; ++t) {
            p[t][0] = options.origin_x + static_cast<double>(t) * options.step_x;
            p[t][1] = options.origin_y + static_cast<double>(t) * options.step_y;
            for (std::int64_t f = 0; f < options.frequencies; ++f) {
                for (std::int64_t c = 0; c < options.channels; ++c) {
                    const auto signal = options.coupling * std::sin(p[t][0] / static_cast<double>(f + 1) + static_cast<double>(c));
                    w[t][f][c] = noise(engine) + static_cast<float>(signal);
                }
            }
        }

        const auto heading = std::atan2(options.step_y, options.step_x);
        const auto speed = std::hypot(options.step_x, options.step_y);

        std::vector<Channel> channels;
        channels.push_back(Channel{std::string(kPositionChannel), position});
        channels.push_back(Channel{"direction", torch::full({options.length, 1}, heading, torch::kFloat64)});
        channels.push_back(Channel{"head_direction", torch::full({options.length, 1}, heading, torch::kFloat64)});
        channels.push_back(Channel{"speed", torch::full({options.length, 1}, speed, torch::kFloat64)});
        return Recording(wavelets, std::move(channels));
    }
}

#endif // INSIGHT_DATA_GENERATION_HPP
