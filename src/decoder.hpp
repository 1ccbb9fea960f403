#ifndef INSIGHT_DECODER_HPP
#define INSIGHT_DECODER_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "activation/apply.hpp"
#include "common/options.hpp"
#include "layer/layer.hpp"
#include "regularization/regularization.hpp"
#include "utils/terminal.hpp"

namespace Insight {
    struct DecoderOutput {
        // One tensor per target, in target order: [B, output_dim] once dim 1 is squeezed.
        std::vector<torch::Tensor> predictions{};
        // Scalar; undefined unless requested.
        torch::Tensor similarity{};
    };

    /*
     * Multi-head convolutional decoder over wavelet windows.
     *
     *   input  [B, C, T, F, 1] -> permute [B, C, 1, T, F]  (channels are the distributed axis)
     *   noise  (training only)
     *   num_convs_tsr x { conv (2,1)-stride, act, conv (1,2)-stride, act }  per channel
     *   permute (0, 4, 2, 3, 1)
     *   while H > 2 { conv kernel (2,1) stride (2,2), act }                  H starts at C
     *   flatten -> [B, D, W]
     *   per target: num_dense x { linear, act, dropout } -> linear -> squeeze(1)
     *
     * W is measured with a dry forward pass at construction.
     */
    class StandardDecoderImpl : public torch::nn::Module {
    public:
        using Snapshot = torch::OrderedDict<std::string, torch::Tensor>;

        // input_shape: [channel, time, frequency, 1], as reported by the dataset.
        StandardDecoderImpl(Options options, std::vector<std::int64_t> input_shape, torch::Device device = torch::kCPU)
            : options_(std::move(options)),
              input_shape_(std::move(input_shape)),
              device_(device)
        {
            options_.validate();
            if (input_shape_.size() != 4) {
                throw std::invalid_argument("Decoder input shape must be [channel, time, frequency, 1].");
            }
            for (const auto extent : input_shape_) {
                if (extent <= 0) {
                    throw std::invalid_argument("Decoder input shape must be strictly positive.");
                }
            }
            const auto timesteps = input_shape_[1];
            if ((timesteps & (timesteps - 1)) != 0) {
                throw std::invalid_argument("Number of timesteps must be a power of 2, got " + std::to_string(timesteps) + ".");
            }
            if (timesteps != options_.model_timesteps) {
                throw std::invalid_argument("Input window has " + std::to_string(timesteps) + " steps but model_timesteps is "
                                            + std::to_string(options_.model_timesteps) + ".");
            }

            const auto conv_activation = Activation::Details::parse(options_.act_conv);
            const auto dense_activation = Activation::Details::parse(options_.act_fc);

            noise_ = Layer::Details::build_registered_layer(
                *this, Layer::Noise({.sigma = options_.noise_sigma, .relative_detach = true}), "gaussian_noise");
            trunk_dropout_ = register_module("dropout", torch::nn::Dropout(torch::nn::DropoutOptions(options_.trunk_dropout)));

            auto channels = input_shape_[3];
            for (std::int64_t i = 0; i < options_.num_convs_tsr; ++i) {
                add_trunk(Layer::TimeDistributedConv2d({.in_channels = channels,
                                                        .out_channels = options_.filter_size,
                                                        .kernel_size = {options_.kernel_size, options_.kernel_size},
                                                        .stride = {2, 1},
                                                        .padding = {1, 1}},
                                                       conv_activation),
                          "conv_tsr_" + std::to_string(i));
                channels = options_.filter_size;
                add_trunk(Layer::TimeDistributedConv2d({.in_channels = channels,
                                                        .out_channels = options_.filter_size,
                                                        .kernel_size = {options_.kernel_size, options_.kernel_size},
                                                        .stride = {1, 2},
                                                        .padding = {1, 1}},
                                                       conv_activation),
                          "conv_fr_" + std::to_string(i));
            }

            add_trunk(Layer::Transpose({0, 4, 2, 3, 1}), "permute");

            auto height = input_shape_[0];
            for (std::int64_t i = 0; height > 2; ++i) {
                add_trunk(Layer::TimeDistributedConv2d({.in_channels = channels,
                                                        .out_channels = 2 * options_.filter_size,
                                                        .kernel_size = {2, 1},
                                                        .stride = {2, 2},
                                                        .padding = {1, 0}},
                                                       conv_activation),
                          "conv_after_tsr_" + std::to_string(i));
                channels = 2 * options_.filter_size;
                // Round half to even.
                height = static_cast<std::int64_t>(std::nearbyint(static_cast<double>(height) / 2.0));
            }

            flatten_ = Layer::Details::build_registered_layer(*this, Layer::Flatten(), "flatten");

            {
                torch::NoGradGuard no_grad;
                auto dry_run = torch::zeros({1, input_shape_[0], input_shape_[1], input_shape_[2], input_shape_[3]});
                auto features = run_trunk(dry_run);
                distributed_width_ = features.size(1);
                feature_width_ = features.size(2);
            }

            for (const auto& target : options_.targets) {
                Head head{};
                auto width = feature_width_;
                for (std::int64_t d = 0; d < options_.num_dense; ++d) {
                    const auto prefix = "target_" + target.name + "_fc_" + std::to_string(d);
                    head.dense.push_back(Layer::Details::build_registered_layer(
                        *this, Layer::FC({width, options_.num_units_dense}, dense_activation), prefix));
                    head.dropout.push_back(Layer::Details::build_registered_layer(
                        *this, Layer::Dropout({options_.dropout_ratio}), prefix + "_dropout"));
                    width = options_.num_units_dense;
                }
                head.projection = Layer::Details::build_registered_layer(
                    *this, Layer::FC({width, target.output_dim}),
                    "target_" + target.name + "_fc_" + std::to_string(options_.num_dense));
                heads_.push_back(std::move(head));
            }

            this->to(device_);
        }

        DecoderOutput forward(torch::Tensor input, bool return_similarity = false)
        {
            TORCH_CHECK(input.dim() == 5, "Decoder expects [batch, channel, time, frequency, 1], got ", input.sizes());
            const auto flat = run_trunk(input.to(device_));

            DecoderOutput output{};
            output.predictions.reserve(heads_.size());
            std::vector<torch::Tensor> pre_final{};
            pre_final.reserve(heads_.size());

            for (const auto& head : heads_) {
                auto x = flat;
                for (std::size_t d = 0; d < head.dense.size(); ++d) {
                    x = head.dense[d](x);
                    x = head.dropout[d](x);
                }
                pre_final.push_back(x);
                output.predictions.push_back(head.projection(x).squeeze(1));
            }

            if (return_similarity) {
                output.similarity = Regularization::penalty(Regularization::Similarity(), pre_final);
            }
            return output;
        }

        // Detached copies of every parameter and buffer, keyed by module path.
        [[nodiscard]] Snapshot snapshot() const
        {
            torch::NoGradGuard no_grad;
            Snapshot state;
            for (const auto& item : named_parameters(/*recurse=*/true)) {
                state.insert(item.key(), item.value().detach().clone());
            }
            for (const auto& item : named_buffers(/*recurse=*/true)) {
                if (item.value().defined()) {
                    state.insert(item.key(), item.value().detach().clone());
                }
            }
            return state;
        }

        // Strict: every entry must exist with the same shape and nothing may be left over.
        void restore(const Snapshot& state)
        {
            torch::NoGradGuard no_grad;
            std::size_t matched = 0;
            auto copy_into = [&](auto items) {
                for (auto& item : items) {
                    if (!item.value().defined()) {
                        continue;
                    }
                    const auto* stored = state.find(item.key());
                    if (stored == nullptr) {
                        throw std::runtime_error("Snapshot is missing '" + item.key() + "'.");
                    }
                    if (stored->sizes() != item.value().sizes()) {
                        std::ostringstream message;
                        message << "Snapshot entry '" << item.key() << "' has shape " << stored->sizes()
                                << ", expected " << item.value().sizes() << ".";
                        throw std::runtime_error(message.str());
                    }
                    item.value().copy_(*stored);
                    ++matched;
                }
            };
            copy_into(named_parameters(/*recurse=*/true));
            copy_into(named_buffers(/*recurse=*/true));

            if (matched != state.size()) {
                throw std::runtime_error("Snapshot holds " + std::to_string(state.size() - matched)
                                         + " entries that do not belong to this decoder.");
            }
        }

        void describe(std::ostream& stream) const
        {
            const auto row = [&](const std::string& name, const torch::nn::Module& module) {
                std::int64_t count = 0;
                for (const auto& parameter : module.parameters()) {
                    count += parameter.numel();
                }
                stream << "  " << std::left << std::setw(32) << name << std::right << std::setw(12) << count << '\n';
            };

            stream << "StandardDecoder input [" << input_shape_[0] << ", " << input_shape_[1] << ", "
                   << input_shape_[2] << ", " << input_shape_[3] << "] features [" << distributed_width_ << ", "
                   << feature_width_ << "] on " << device_ << '\n';
            for (const auto& layer : trunk_) {
                row(layer.name, *layer.module);
            }
            row(flatten_.name, *flatten_.module);
            for (const auto& head : heads_) {
                for (const auto& layer : head.dense) {
                    row(layer.name, *layer.module);
                }
                row(head.projection.name, *head.projection.module);
            }
        }

        [[nodiscard]] const Options& options() const noexcept { return options_; }
        [[nodiscard]] const std::vector<std::int64_t>& input_shape() const noexcept { return input_shape_; }
        [[nodiscard]] torch::Device device() const noexcept { return device_; }
        [[nodiscard]] std::int64_t feature_width() const noexcept { return feature_width_; }
        [[nodiscard]] std::int64_t distributed_width() const noexcept { return distributed_width_; }
        [[nodiscard]] std::vector<std::string> target_names() const { return options_.target_names(); }

    private:
        struct Head {
            std::vector<Layer::RegisteredLayer> dense{};
            std::vector<Layer::RegisteredLayer> dropout{};
            Layer::RegisteredLayer projection{};
        };

        template <class Descriptor>
        void add_trunk(const Descriptor& descriptor, const std::string& name)
        {
            trunk_.push_back(Layer::Details::build_registered_layer(*this, descriptor, name));
        }

        // [B, C, T, F, 1] -> [B, D, W]; trunk dropout follows every conv stage and every activation.
        torch::Tensor run_trunk(torch::Tensor x)
        {
            x = noise_(x.permute({0, 1, 4, 2, 3}));
            for (const auto& layer : trunk_) {
                x = trunk_dropout_(layer.forward(std::move(x)));
                if (layer.has_activation()) {
                    x = trunk_dropout_(Activation::Details::apply(layer.activation, std::move(x)));
                }
            }
            return flatten_.forward(std::move(x));
        }

        Options options_{};
        std::vector<std::int64_t> input_shape_{};
        torch::Device device_{torch::kCPU};
        Layer::RegisteredLayer noise_{};
        torch::nn::Dropout trunk_dropout_{nullptr};
        std::vector<Layer::RegisteredLayer> trunk_{};
        Layer::RegisteredLayer flatten_{};
        std::vector<Head> heads_{};
        std::int64_t distributed_width_{0};
        std::int64_t feature_width_{0};
    };

    TORCH_MODULE(StandardDecoder);
}

#endif // INSIGHT_DECODER_HPP
