#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <numbers>
#include <numeric>
#include <set>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "fixtures.hpp"

using namespace Insight;

namespace {
    std::vector<std::int64_t> first_indices(std::int64_t count)
    {
        std::vector<std::int64_t> indices(static_cast<std::size_t>(count));
        std::iota(indices.begin(), indices.end(), std::int64_t{0});
        return indices;
    }

    Data::WaveletDataset make_dataset(const Options& options, const Data::Recording& recording,
                                      Data::Region region = Data::Region::None)
    {
        const auto indices = first_indices(recording.length() - options.model_timesteps);
        auto statistics = Data::NormalizationStatistics::estimate(recording.wavelets(), indices);
        return Data::WaveletDataset(options, recording, indices, statistics, region);
    }
}

TEST(Normalization, MedianOfEvenCountAveragesMiddleValues) {
    const auto values = torch::tensor({4.0, 1.0, 3.0, 2.0}, torch::kFloat64).unsqueeze(1);
    const auto median = Data::Details::median_along_first(values);
    EXPECT_DOUBLE_EQ(median.item<double>(), 2.5);
}

TEST(Normalization, TrainingRowsHaveZeroMedianAfterNormalising) {
    const auto recording = Test::small_recording();
    const auto training = first_indices(90);
    const auto statistics = Data::NormalizationStatistics::estimate(recording.wavelets(), training);

    const auto rows = recording.wavelets().index_select(0, torch::tensor(training, torch::kLong));
    const auto normalised = statistics.apply(rows).to(torch::kFloat64);
    const auto median = Data::Details::median_along_first(normalised);
    EXPECT_LT(median.abs().max().item<double>(), 1e-4);

    const auto mad = Data::Details::median_along_first((normalised - median).abs());
    EXPECT_NEAR(mad.mean().item<double>(), 1.0, 1e-3);
}

TEST(Normalization, ConstantBandIsRejected) {
    const auto wavelets = torch::ones({32, 2, 2});
    EXPECT_THROW((void)Data::NormalizationStatistics::estimate(wavelets, first_indices(16)), std::invalid_argument);
}

TEST(WaveletDataset, SampleShapesFollowTargetOrder) {
    const auto options = Test::small_options();
    auto dataset = make_dataset(options, Test::small_recording());

    const auto sample = dataset.get(0);
    EXPECT_EQ(sample.input.sizes(), torch::IntArrayRef({4, 16, 8, 1}));
    ASSERT_EQ(sample.labels.size(), 3u);
    EXPECT_EQ(sample.labels[0].sizes(), torch::IntArrayRef({2}));
    EXPECT_EQ(sample.labels[1].sizes(), torch::IntArrayRef({1}));
    EXPECT_EQ(sample.labels[2].sizes(), torch::IntArrayRef({1}));
    EXPECT_EQ(dataset.input_shape(), Test::small_input_shape());
    EXPECT_EQ(dataset.size().value(), dataset.indices().size());
}

TEST(WaveletDataset, PositionLabelIsLastStepOfWindow) {
    const auto options = Test::small_options({{"position", 2}});
    auto dataset = make_dataset(options, Test::small_recording());

    const auto sample = dataset.get(5);
    const auto last = 5 + options.model_timesteps - 1;
    EXPECT_FLOAT_EQ(sample.labels[0][0].item<float>(), static_cast<float>(last));
    EXPECT_FLOAT_EQ(sample.labels[0][1].item<float>(), 0.0f);
}

TEST(WaveletDataset, UnitStepGivesUnitSpeed) {
    const auto options = Test::small_options({{"speed", 1}});
    auto dataset = make_dataset(options, Test::small_recording(1.0, 0.0));
    for (std::size_t index : {0u, 7u, 40u}) {
        EXPECT_NEAR(dataset.get(index).labels[0].item<float>(), 1.0f, 1e-6);
    }
}

TEST(WaveletDataset, DirectionFollowsDisplacement) {
    const auto options = Test::small_options({{"direction", 1}});

    auto along_x = make_dataset(options, Test::small_recording(1.0, 0.0));
    EXPECT_NEAR(along_x.get(3).labels[0].item<float>(), 0.0f, 1e-6);

    auto along_y = make_dataset(options, Test::small_recording(0.0, 1.0));
    EXPECT_NEAR(along_y.get(3).labels[0].item<float>(), static_cast<float>(std::numbers::pi / 2.0), 1e-6);
}

TEST(WaveletDataset, DirectionIgnoresItsOwnChannel) {
    const auto base = Test::small_recording(0.0, 1.0);
    const auto length = base.length();
    std::vector<Data::Channel> channels{
        {"position", base.channel("position")},
        {"direction", torch::full({length, 1}, 7.0, torch::kFloat64)},
        {"head_direction", torch::full({length, 1}, -7.0, torch::kFloat64)}};
    const Data::Recording recording(base.wavelets(), channels);

    auto dataset = make_dataset(Test::small_options({{"direction", 1}, {"head_direction", 1}}), recording);
    const auto sample = dataset.get(0);
    EXPECT_NEAR(sample.labels[0].item<float>(), static_cast<float>(std::numbers::pi / 2.0), 1e-6);
    EXPECT_NEAR(sample.labels[1].item<float>(), static_cast<float>(std::numbers::pi / 2.0), 1e-6);
}

TEST(WaveletDataset, UnknownTargetIsRejected) {
    const auto recording = Test::small_recording();
    EXPECT_THROW((void)make_dataset(Test::small_options({{"velocity", 1}}), recording), std::invalid_argument);
}

TEST(WaveletDataset, DerivedTargetsNeedPositionChannel) {
    const auto base = Test::small_recording();
    const Data::Recording recording(base.wavelets(), {{"speed", base.channel("speed")}});
    EXPECT_THROW((void)make_dataset(Test::small_options({{"speed", 1}}), recording), std::invalid_argument);
}

TEST(WaveletDataset, IndexOutsideRecordingIsRejected) {
    const auto options = Test::small_options({{"speed", 1}});
    const auto recording = Test::small_recording();
    const auto statistics = Data::NormalizationStatistics::estimate(recording.wavelets(), first_indices(10));
    const std::vector<std::int64_t> indices{0, recording.length() - options.model_timesteps + 1};
    EXPECT_THROW(Data::WaveletDataset(options, recording, indices, statistics), std::out_of_range);
}

TEST(WaveletDataset, DeterministicLookupIsBoundsChecked) {
    auto dataset = make_dataset(Test::small_options({{"speed", 1}}), Test::small_recording());
    EXPECT_THROW((void)dataset.get(dataset.indices().size()), std::out_of_range);
}

TEST(WaveletDataset, ShuffleDrawsFromIndexSet) {
    auto options = Test::small_options({{"position", 2}});
    options.shuffle = true;
    auto dataset = make_dataset(options, Test::small_recording());

    const auto largest = static_cast<float>(dataset.indices().back() + options.model_timesteps - 1);
    for (int draw = 0; draw < 20; ++draw) {
        const auto x = dataset.get(0).labels[0][0].item<float>();
        EXPECT_GE(x, static_cast<float>(options.model_timesteps - 1));
        EXPECT_LE(x, largest);
    }
}

TEST(WaveletDataset, RandomBatchesIgnoreRequestedIndex) {
    auto options = Test::small_options({{"position", 2}});
    options.random_batches = true;
    const auto recording = Test::small_recording();
    const std::vector<std::int64_t> indices{10, 40, 70};
    const auto statistics = Data::NormalizationStatistics::estimate(recording.wavelets(), first_indices(90));
    Data::WaveletDataset dataset(options, recording, indices, statistics);

    std::set<float> seen;
    for (std::size_t draw = 0; draw < 40; ++draw) {
        // Past the end of the split: a deterministic lookup would throw here.
        const auto x = dataset.get(draw * 100).labels[0][0].item<float>();
        const auto start = static_cast<std::int64_t>(x) - options.model_timesteps + 1;
        EXPECT_NE(std::find(indices.begin(), indices.end(), start), indices.end()) << x;
        seen.insert(x);
    }
    EXPECT_GT(seen.size(), 1u);
}

TEST(WaveletDataset, RegionFilterRedrawsUntilAccepted) {
    const auto options = Test::small_options({{"position", 2}});
    // y climbs from -0.5 by 0.01 per step; only windows ending past step 60 pass "top".
    auto dataset = make_dataset(options, Test::small_recording(0.0, 0.01, -0.5), Data::Region::Top);
    for (int draw = 0; draw < 10; ++draw) {
        EXPECT_GT(dataset.get(0).labels[0][1].item<float>(), 0.1f);
    }
}

TEST(WaveletDataset, RegionFilterExhaustionThrows) {
    auto options = Test::small_options({{"position", 2}});
    options.max_filter_retries = 5;
    auto dataset = make_dataset(options, Test::small_recording(1.0, 0.0), Data::Region::Top);
    EXPECT_THROW((void)dataset.get(0), std::runtime_error);
}

TEST(Region, TopAndBottomAreComplementary) {
    for (double y = -1.0; y <= 1.0; y += 0.05) {
        EXPECT_NE(Data::Details::accept(Data::Region::Top, 0.0, y), Data::Details::accept(Data::Region::Bottom, 0.0, y));
        EXPECT_NE(Data::Details::accept(Data::Region::Inside, 0.0, y), Data::Details::accept(Data::Region::Outside, 0.0, y));
    }
    EXPECT_TRUE(Data::Details::accept(Data::Region::Bottom, 0.0, 0.1));
    EXPECT_TRUE(Data::Details::accept(Data::Region::Right, 400.0, 0.0));
    EXPECT_TRUE(Data::Details::accept(Data::Region::Left, 399.9, 0.0));
}

TEST(Region, ComplementPairsKeywords) {
    EXPECT_EQ(Data::Partition::complement(Data::Region::Top), Data::Region::Bottom);
    EXPECT_EQ(Data::Partition::complement(Data::Region::Outside), Data::Region::Inside);
    EXPECT_EQ(Data::Partition::complement(Data::Region::Left), Data::Region::Right);
    EXPECT_EQ(Data::Partition::complement(Data::Region::None), Data::Region::None);
}

TEST(Region, UnknownKeywordIsRejected) {
    EXPECT_THROW((void)Data::Partition::region("middle"), std::invalid_argument);
    EXPECT_EQ(Data::Partition::region(""), Data::Region::None);
}

TEST(Recording, MisalignedChannelIsRejected) {
    const auto wavelets = torch::randn({32, 4, 2});
    EXPECT_THROW(Data::Recording(wavelets, {{"position", torch::zeros({31, 2})}}), std::invalid_argument);
    EXPECT_THROW(Data::Recording(torch::randn({32, 4}), {}), std::invalid_argument);
}

TEST(Stack, CollatesSamplesIntoBatch) {
    const auto options = Test::small_options();
    auto dataset = make_dataset(options, Test::small_recording());
    auto loader = torch::data::make_data_loader<torch::data::samplers::SequentialSampler>(
        dataset.map(Data::Stack()), torch::data::DataLoaderOptions().batch_size(4));

    auto batch = *loader->begin();
    EXPECT_EQ(batch.inputs.sizes(), torch::IntArrayRef({4, 4, 16, 8, 1}));
    ASSERT_EQ(batch.labels.size(), 3u);
    EXPECT_EQ(batch.labels[0].sizes(), torch::IntArrayRef({4, 2}));
    EXPECT_EQ(batch.labels[2].sizes(), torch::IntArrayRef({4, 1}));
}
