#include <gtest/gtest.h>

#include <cstdint>
#include <numeric>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "fixtures.hpp"

using namespace Insight;

TEST(Partition, ContiguousBlocksCoverRangeExactly) {
    for (std::int64_t count = 2; count <= 40; ++count) {
        for (std::int64_t num_cv = 2; num_cv <= count; ++num_cv) {
            const auto blocks = Data::Partition::split_contiguous(count, num_cv);
            ASSERT_EQ(static_cast<std::int64_t>(blocks.size()), num_cv);

            std::vector<std::int64_t> joined;
            for (std::size_t b = 0; b < blocks.size(); ++b) {
                const auto expected = count / num_cv + (static_cast<std::int64_t>(b) < count % num_cv ? 1 : 0);
                EXPECT_EQ(static_cast<std::int64_t>(blocks[b].size()), expected) << "count " << count << " num_cv " << num_cv;
                joined.insert(joined.end(), blocks[b].begin(), blocks[b].end());
            }

            std::vector<std::int64_t> range(static_cast<std::size_t>(count));
            std::iota(range.begin(), range.end(), std::int64_t{0});
            EXPECT_EQ(joined, range) << "count " << count << " num_cv " << num_cv;
        }
    }
}

TEST(Partition, BlockCountOutsideRangeIsRejected) {
    EXPECT_THROW((void)Data::Partition::split_contiguous(10, 1), std::invalid_argument);
    EXPECT_THROW((void)Data::Partition::split_contiguous(10, 11), std::invalid_argument);
}

TEST(Partition, LastBlockIsHeldOut) {
    const auto split = Data::Partition::contiguous_indices(100, 16, 4);
    ASSERT_EQ(split.training.size(), 63u);
    ASSERT_EQ(split.testing.size(), 21u);
    EXPECT_EQ(split.training.front(), 0);
    EXPECT_EQ(split.training.back(), 62);
    EXPECT_EQ(split.testing.front(), 63);
    EXPECT_EQ(split.testing.back(), 83);
}

TEST(Partition, SkipFirstShiftsEveryIndex) {
    const auto split = Data::Partition::contiguous_indices(100, 16, 4, /*skip_first=*/true);
    EXPECT_EQ(split.training.front(), 1);
    EXPECT_EQ(split.testing.back(), 83);
    EXPECT_EQ(split.training.size() + split.testing.size(), 83u);
}

TEST(Partition, RecordingShorterThanWindowIsRejected) {
    EXPECT_THROW((void)Data::Partition::contiguous_indices(16, 16, 2), std::invalid_argument);
}

TEST(Partition, BothViewsShareTrainingStatistics) {
    const auto options = Test::small_options();
    const auto recording = Test::small_recording();
    const auto split = Data::Partition::contiguous_indices(recording.length(), options.model_timesteps, options.num_cvs);

    const auto pair = Data::Partition::create_train_and_test_datasets(options, recording, split, Data::Region::None, nullptr);
    const auto expected = Data::NormalizationStatistics::estimate(recording.wavelets(), split.training);

    EXPECT_TRUE(torch::equal(pair.training.statistics().median, expected.median));
    EXPECT_TRUE(torch::equal(pair.testing.statistics().median, expected.median));
    EXPECT_TRUE(torch::equal(pair.testing.statistics().mad, pair.training.statistics().mad));
    EXPECT_EQ(pair.training.indices(), split.training);
    EXPECT_EQ(pair.testing.indices(), split.testing);
}

TEST(Partition, TestViewFiltersWithComplement) {
    const auto options = Test::small_options({{"position", 2}});
    const auto recording = Test::small_recording();
    const auto split = Data::Partition::contiguous_indices(recording.length(), options.model_timesteps, options.num_cvs);

    const auto pair = Data::Partition::create_train_and_test_datasets(options, recording, split, "inside", nullptr);
    EXPECT_EQ(pair.training.region(), Data::Region::Inside);
    EXPECT_EQ(pair.testing.region(), Data::Region::Outside);

    EXPECT_THROW((void)Data::Partition::create_train_and_test_datasets(options, recording, split, "north", nullptr),
                 std::invalid_argument);
}

TEST(Partition, WholeRecordingSplitUsesConfiguredFolds) {
    const auto options = Test::small_options();
    const auto recording = Test::small_recording();
    Data::Partition::Options partition{};
    partition.stream = nullptr;

    const auto pair = Data::Partition::create_train_and_test_datasets(options, recording, Data::Region::None, partition);
    EXPECT_EQ(pair.training.size().value() + pair.testing.size().value(),
              static_cast<std::size_t>(recording.length() - options.model_timesteps));
    EXPECT_EQ(pair.testing.size().value(), 28u);
}
