#ifndef INSIGHT_EVALUATION_DECODING_HPP
#define INSIGHT_EVALUATION_DECODING_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <numbers>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/options.hpp"
#include "../../loss/loss.hpp"
#include "../../utils/terminal.hpp"

namespace Insight::Evaluation::Details::Decoding {
    // Arena calibration of the reference recordings: 582 px span 1.7 m.
    inline constexpr double kMetresPerPixel = 1.7 / 582.0;
    inline constexpr double kDegreesPerRadian = 180.0 / std::numbers::pi;

    struct Options {
        // Multiplier per target, in target order; empty means 1 everywhere.
        std::vector<double> scales{};
        bool print_summary{true};
        std::ostream* stream{&std::cout};
    };

    struct Report {
        std::vector<std::string> targets{};
        std::vector<double> values{};
        double similarity{0.0};
        std::size_t total_samples{0};
    };

    // Position and speed in metres, directions in degrees.
    [[nodiscard]] inline std::vector<double> physical_scales(const ::Insight::Options& options)
    {
        std::vector<double> scales;
        scales.reserve(options.targets.size());
        for (const auto& target : options.targets) {
            if (target.name == "direction" || target.name == "head_direction") {
                scales.push_back(kDegreesPerRadian);
            } else {
                scales.push_back(kMetresPerPixel);
            }
        }
        return scales;
    }

    namespace detail {
        inline std::string format_double(double value)
        {
            if (!std::isfinite(value)) {
                return "nan";
            }
            std::ostringstream out;
            out << std::fixed << std::setprecision(6) << value;
            return out.str();
        }

        // Switches the decoder to eval mode and puts the previous mode back on scope exit.
        template <class Decoder>
        class TrainingModeGuard {
        public:
            explicit TrainingModeGuard(Decoder& decoder) : decoder_(decoder), was_training_(decoder->is_training())
            {
                decoder_->eval();
            }
            ~TrainingModeGuard() { decoder_->train(was_training_); }

            TrainingModeGuard(const TrainingModeGuard&) = delete;
            TrainingModeGuard& operator=(const TrainingModeGuard&) = delete;

        private:
            Decoder& decoder_;
            bool was_training_;
        };
    }

    inline void Print(const Report& report, const Options& options);

    /*
     * Sample-weighted mean loss per target over every batch of `loader`, with gradients
     * off and the decoder in eval mode. The previous training state is restored afterwards.
     */
    template <class Decoder, class Loader>
    [[nodiscard]] auto Evaluate(Decoder& decoder,
                                Loader& loader,
                                const std::vector<Loss::Descriptor>& losses,
                                const Options& options = {}) -> Report
    {
        const auto names = decoder->target_names();
        if (losses.size() != names.size()) {
            throw std::invalid_argument("Evaluation needs one loss per decoder target.");
        }
        if (!options.scales.empty() && options.scales.size() != names.size()) {
            throw std::invalid_argument("Evaluation scales must be empty or match the decoder targets.");
        }

        Report report{};
        report.targets = names;
        report.values.assign(names.size(), 0.0);

        torch::NoGradGuard guard;
        detail::TrainingModeGuard<Decoder> mode(decoder);

        double similarity_sum = 0.0;
        for (auto& batch : loader) {
            const auto count = static_cast<double>(batch.inputs.size(0));
            auto output = decoder->forward(batch.inputs, /*return_similarity=*/true);
            for (std::size_t k = 0; k < names.size(); ++k) {
                const auto label = batch.labels[k].to(output.predictions[k].device());
                report.values[k] += Loss::compute(losses[k], output.predictions[k], label).template item<double>() * count;
            }
            similarity_sum += output.similarity.template item<double>();
            report.total_samples += static_cast<std::size_t>(batch.inputs.size(0));
        }

        if (report.total_samples == 0) {
            throw std::runtime_error("Evaluation loader produced no samples.");
        }
        for (std::size_t k = 0; k < names.size(); ++k) {
            const double scale = options.scales.empty() ? 1.0 : options.scales[k];
            report.values[k] = report.values[k] / static_cast<double>(report.total_samples) * scale;
        }
        report.similarity = similarity_sum / static_cast<double>(report.total_samples);

        if (options.stream && options.print_summary) {
            Print(report, options);
        }
        return report;
    }

    inline void Print(const Report& report, const Options& options)
    {
        if (!options.stream || report.values.size() != report.targets.size()) {
            return;
        }

        auto& stream = *options.stream;
        using namespace Utils::Terminal;
        const auto color = Colors::kBrightBlue;

        std::size_t target_width = std::string("Target").size();
        std::size_t value_width = std::string("Mean loss").size();
        std::vector<std::string> value_strings;
        value_strings.reserve(report.values.size());
        for (std::size_t i = 0; i < report.targets.size(); ++i) {
            target_width = std::max(target_width, report.targets[i].size());
            value_strings.push_back(detail::format_double(report.values[i]));
            value_width = std::max(value_width, value_strings.back().size());
        }
        target_width = std::max(target_width, std::string("Evaluation: Decoding").size());

        const std::vector<std::size_t> spacings{target_width + 2, value_width + 2};

        stream << '\n' << HTop(spacings, color) << '\n';

        auto print_row = [&](std::string_view target, std::string_view value) {
            std::ostringstream row;
            row << Symbols::kBoxVertical << ' ';
            row << std::left << std::setw(static_cast<int>(target_width)) << target;
            row << std::right;
            row << ' ' << Symbols::kBoxVertical << ' ';
            row << std::setw(static_cast<int>(value_width)) << value;
            row << ' ' << Symbols::kBoxVertical;
            stream << row.str() << '\n';
        };

        print_row("Evaluation: Decoding", "");
        stream << HMid(spacings, color) << '\n';
        print_row("Target", "Mean loss");
        stream << HMid(spacings, color) << '\n';
        for (std::size_t i = 0; i < report.targets.size(); ++i) {
            print_row(report.targets[i], value_strings[i]);
        }
        stream << HBottom(spacings, color) << '\n';

        stream << "\nHead similarity per sample: " << detail::format_double(report.similarity);
        stream << "\nTotal samples: " << report.total_samples << '\n';
    }
}

#endif // INSIGHT_EVALUATION_DECODING_HPP
