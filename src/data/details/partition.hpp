#ifndef INSIGHT_DATA_PARTITION_HPP
#define INSIGHT_DATA_PARTITION_HPP

#include <cstdint>
#include <iostream>
#include <numeric>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../../common/options.hpp"
#include "../../utils/terminal.hpp"
#include "dataset.hpp"
#include "normalization.hpp"
#include "recording.hpp"
#include "region.hpp"

namespace Insight::Data::Details {
    struct IndexSplit {
        std::vector<std::int64_t> training{};
        std::vector<std::int64_t> testing{};
    };

    struct DatasetPair {
        WaveletDataset training;
        WaveletDataset testing;
    };

    struct PartitionOptions {
        // Start at 1 so the previous window never begins before time 0.
        bool skip_first{false};
        std::ostream* stream{&std::cout};
    };

    // [0, count) cut into num_cv contiguous blocks; the first count % num_cv blocks hold one extra element.
    [[nodiscard]] inline std::vector<std::vector<std::int64_t>> split_contiguous(std::int64_t count, std::int64_t num_cv)
    {
        if (num_cv < 2 || num_cv > count) {
            throw std::invalid_argument("Cannot split " + std::to_string(count) + " windows into "
                                        + std::to_string(num_cv) + " contiguous blocks.");
        }
        const auto base = count / num_cv;
        const auto extra = count % num_cv;

        std::vector<std::vector<std::int64_t>> blocks(static_cast<std::size_t>(num_cv));
        std::int64_t begin = 0;
        for (std::int64_t block = 0; block < num_cv; ++block) {
            const auto length = base + (block < extra ? 1 : 0);
            auto& indices = blocks[static_cast<std::size_t>(block)];
            indices.resize(static_cast<std::size_t>(length));
            std::iota(indices.begin(), indices.end(), begin);
            begin += length;
        }
        return blocks;
    }

    // Window starts in [offset, length - T): every block but the last trains, the last tests.
    [[nodiscard]] inline IndexSplit contiguous_indices(std::int64_t recording_length,
                                                       std::int64_t model_timesteps,
                                                       std::int64_t num_cv,
                                                       bool skip_first = false)
    {
        const std::int64_t offset = skip_first ? 1 : 0;
        const auto count = recording_length - model_timesteps - offset;
        if (count <= 0) {
            throw std::invalid_argument("Recording of " + std::to_string(recording_length) + " steps is too short for "
                                        + std::to_string(model_timesteps) + "-step windows.");
        }

        auto blocks = split_contiguous(count, num_cv);
        IndexSplit split{};
        for (std::size_t block = 0; block + 1 < blocks.size(); ++block) {
            for (const auto index : blocks[block]) {
                split.training.push_back(index + offset);
            }
        }
        for (const auto index : blocks.back()) {
            split.testing.push_back(index + offset);
        }
        return split;
    }

    // Both views share the statistics estimated on the training rows. The test view filters
    // with the complement of `region`.
    [[nodiscard]] inline DatasetPair create_train_and_test_datasets(const Options& options,
                                                                    const Recording& recording,
                                                                    const IndexSplit& split,
                                                                    Region region = Region::None,
                                                                    std::ostream* stream = &std::cout)
    {
        options.validate();
        auto statistics = NormalizationStatistics::estimate(recording.wavelets(), split.training);

        DatasetPair pair{
            WaveletDataset(options, recording, split.training, statistics, region),
            WaveletDataset(options, recording, split.testing, statistics, complement(region))};

        Utils::Terminal::Log(stream,
            "Split " + std::to_string(split.training.size()) + " training / "
            + std::to_string(split.testing.size()) + " testing windows (region "
            + std::string(region_name(region)) + " / " + std::string(region_name(complement(region))) + ").");
        return pair;
    }

    [[nodiscard]] inline DatasetPair create_train_and_test_datasets(const Options& options,
                                                                    const Recording& recording,
                                                                    const IndexSplit& split,
                                                                    std::string_view region,
                                                                    std::ostream* stream = &std::cout)
    {
        return create_train_and_test_datasets(options, recording, split, parse_region(region), stream);
    }

    // Contiguous split over the whole recording, sized by options.num_cvs.
    [[nodiscard]] inline DatasetPair create_train_and_test_datasets(const Options& options,
                                                                    const Recording& recording,
                                                                    Region region = Region::None,
                                                                    const PartitionOptions& partition = {})
    {
        const auto split = contiguous_indices(recording.length(), options.model_timesteps, options.num_cvs, partition.skip_first);
        return create_train_and_test_datasets(options, recording, split, region, partition.stream);
    }
}

#endif // INSIGHT_DATA_PARTITION_HPP
