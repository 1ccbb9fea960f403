#include <cstdint>
#include <filesystem>
#include <iostream>
#include <vector>

#include <torch/torch.h>

#include "../include/Insight.h"

int main() {
    const bool use_cuda = torch::cuda::is_available();
    const torch::Device device = use_cuda ? torch::Device(torch::kCUDA) : torch::Device(torch::kCPU);
    std::cout << "Cuda: " << use_cuda << std::endl;

    Insight::Options options{};
    options.model_timesteps = 32;
    options.num_cvs = 5;
    options.targets = {
        {"position", 2, "euclidean", 1.0},
        {"direction", 1, "cyclical_mae_rad", 25.0},
        {"speed", 1, "mae", 2.0}};
    options.num_convs_tsr = 4;
    options.filter_size = 16;
    options.num_dense = 2;
    options.num_units_dense = 64;
    options.dropout_ratio = 0.3;
    options.batch_size = 16;

    const auto recording = Insight::Data::Synthetic({.length = 4096,
                                                     .frequencies = 16,
                                                     .channels = 8,
                                                     .step_x = 0.75,
                                                     .step_y = 0.25});

    auto [training, testing] = Insight::Data::Partition::create_train_and_test_datasets(options, recording);

    Insight::StandardDecoder decoder(options, training.input_shape(), device);
    decoder->describe(std::cout);

    auto train_loader = torch::data::make_data_loader(
        training.map(Insight::Data::Stack()),
        torch::data::DataLoaderOptions().batch_size(static_cast<std::size_t>(options.batch_size)));
    auto test_loader = torch::data::make_data_loader<torch::data::samplers::SequentialSampler>(
        testing.map(Insight::Data::Stack()),
        torch::data::DataLoaderOptions().batch_size(static_cast<std::size_t>(options.batch_size)));

    const auto losses = Insight::Loss::from_options(options);
    torch::optim::Adam optimizer(decoder->parameters(), torch::optim::AdamOptions(1e-3));

    const std::int64_t epochs = 5;
    for (std::int64_t epoch = 0; epoch < epochs; ++epoch) {
        decoder->train();
        double running = 0.0;
        std::int64_t steps = 0;
        for (auto& batch : *train_loader) {
            std::vector<torch::Tensor> labels;
            for (auto& label : batch.labels) {
                labels.push_back(label.to(device));
            }

            optimizer.zero_grad();
            auto output = decoder->forward(batch.inputs, /*return_similarity=*/true);
            auto loss = Insight::Loss::weighted_sum(options, losses, output.predictions, labels) + output.similarity * 1e-3;
            loss.backward();
            optimizer.step();

            running += loss.item<double>();
            ++steps;
        }
        std::cout << "Epoch " << epoch + 1 << "/" << epochs << " loss " << running / static_cast<double>(steps) << std::endl;
    }

    Insight::Evaluation::DecodingOptions evaluation{};
    evaluation.scales = Insight::Evaluation::PhysicalScales(options);
    (void)Insight::Evaluation::Evaluate(decoder, *test_loader, losses, evaluation);

    Insight::Common::SaveLoad::save(decoder, std::filesystem::temp_directory_path() / "insight_demo_decoder");
    return 0;
}
