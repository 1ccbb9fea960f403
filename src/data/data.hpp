#ifndef INSIGHT_DATA_HPP
#define INSIGHT_DATA_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstdint>
#include <iostream>
#include <ostream>
#include <string_view>
#include <vector>

#include "details/collate.hpp"
#include "details/dataset.hpp"
#include "details/generation.hpp"
#include "details/normalization.hpp"
#include "details/partition.hpp"
#include "details/recording.hpp"
#include "details/region.hpp"
#include "details/target.hpp"

namespace Insight::Data {
    using Channel = Details::Channel;
    using Recording = Details::Recording;
    using Sample = Details::Sample;
    using Batch = Details::Batch;
    using Stack = Details::Stack;
    using WaveletDataset = Details::WaveletDataset;
    using NormalizationStatistics = Details::NormalizationStatistics;
    using Region = Details::Region;
    using TargetKind = Details::TargetKind;
    using SyntheticOptions = Details::SyntheticOptions;

    namespace Partition {
        using IndexSplit = Details::IndexSplit;
        using DatasetPair = Details::DatasetPair;
        using Options = Details::PartitionOptions;

        [[nodiscard]] inline std::vector<std::vector<std::int64_t>> split_contiguous(std::int64_t count, std::int64_t num_cv) {
            return Details::split_contiguous(count, num_cv);
        }

        [[nodiscard]] inline IndexSplit contiguous_indices(std::int64_t length, std::int64_t model_timesteps,
                                                           std::int64_t num_cv, bool skip_first = false) {
            return Details::contiguous_indices(length, model_timesteps, num_cv, skip_first);
        }

        [[nodiscard]] constexpr Region complement(Region region) noexcept { return Details::complement(region); }

        [[nodiscard]] inline Region region(std::string_view keyword) { return Details::parse_region(keyword); }

        [[nodiscard]] inline DatasetPair create_train_and_test_datasets(const Insight::Options& options, const Recording& recording,
                                                                        const IndexSplit& split, Region region = Region::None,
                                                                        std::ostream* stream = &std::cout) {
            return Details::create_train_and_test_datasets(options, recording, split, region, stream);
        }

        [[nodiscard]] inline DatasetPair create_train_and_test_datasets(const Insight::Options& options, const Recording& recording,
                                                                        const IndexSplit& split, std::string_view region,
                                                                        std::ostream* stream = &std::cout) {
            return Details::create_train_and_test_datasets(options, recording, split, region, stream);
        }

        [[nodiscard]] inline DatasetPair create_train_and_test_datasets(const Insight::Options& options, const Recording& recording,
                                                                        Region region = Region::None, const Options& partition = {}) {
            return Details::create_train_and_test_datasets(options, recording, region, partition);
        }
    }

    [[nodiscard]] inline Recording Synthetic(const SyntheticOptions& options = {}) { return Details::Synthetic(options); }
}

#endif // INSIGHT_DATA_HPP
