#include <gtest/gtest.h>

#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "fixtures.hpp"

using namespace Insight;

namespace {
    class SaveLoadTest : public ::testing::Test {
    protected:
        void SetUp() override
        {
            std::random_device device;
            directory = std::filesystem::temp_directory_path() / ("insight_save_load_" + std::to_string(device()));
        }

        void TearDown() override
        {
            std::filesystem::remove_all(directory);
        }

        std::filesystem::path directory;
    };
}

TEST_F(SaveLoadTest, RestoresArchitectureAndParameters) {
    StandardDecoder decoder(Test::small_options(), Test::small_input_shape());
    Common::SaveLoad::save(decoder, directory, nullptr);

    EXPECT_TRUE(std::filesystem::exists(directory / "architecture.json"));
    EXPECT_TRUE(std::filesystem::exists(directory / "parameters.binary"));

    auto loaded = Common::SaveLoad::load(directory);
    EXPECT_EQ(loaded->input_shape(), decoder->input_shape());
    EXPECT_EQ(loaded->target_names(), decoder->target_names());

    const auto expected = decoder->snapshot();
    const auto actual = loaded->snapshot();
    ASSERT_EQ(actual.size(), expected.size());
    for (const auto& item : expected) {
        EXPECT_TRUE(torch::equal(*actual.find(item.key()), item.value())) << item.key();
    }

    decoder->eval();
    loaded->eval();
    const auto input = torch::randn({2, 4, 16, 8, 1});
    EXPECT_TRUE(torch::allclose(decoder->forward(input).predictions[0], loaded->forward(input).predictions[0]));
}

TEST_F(SaveLoadTest, MissingDirectoryFails) {
    EXPECT_THROW((void)Common::SaveLoad::load(directory / "absent"), std::runtime_error);
}
