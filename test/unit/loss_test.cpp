#include <gtest/gtest.h>

#include <cmath>
#include <numbers>
#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "fixtures.hpp"

using namespace Insight;

TEST(Loss, EuclideanIsMeanDistance) {
    const auto prediction = torch::tensor({{0.0f, 0.0f}, {1.0f, 1.0f}});
    const auto target = torch::tensor({{3.0f, 4.0f}, {1.0f, 1.0f}});
    EXPECT_NEAR(Loss::compute(Loss::Euclidean(), prediction, target).item<double>(), 2.5, 1e-5);
}

TEST(Loss, CyclicalErrorWrapsAround) {
    const auto prediction = torch::tensor({{3.0f}});
    const auto target = torch::tensor({{-3.0f}});
    const double wrapped = 2.0 * std::numbers::pi - 6.0;
    EXPECT_NEAR(Loss::compute(Loss::CyclicalMAE(), prediction, target).item<double>(), wrapped, 1e-5);
    EXPECT_NEAR(Loss::compute(Loss::CyclicalMAE(), target, target).item<double>(), 0.0, 1e-7);
}

TEST(Loss, ScalarHeadsAcceptFlatLabels) {
    const auto prediction = torch::tensor({{1.0f}, {3.0f}});
    const auto target = torch::tensor({0.0f, 0.0f});
    EXPECT_NEAR(Loss::compute(Loss::MAE(), prediction, target).item<double>(), 2.0, 1e-6);
    EXPECT_NEAR(Loss::compute(Loss::MSE(), prediction, target).item<double>(), 5.0, 1e-6);
}

TEST(Loss, NamesResolveToDescriptors) {
    EXPECT_TRUE(std::holds_alternative<Loss::Details::EuclideanDescriptor>(Loss::from_name("euclidean")));
    EXPECT_TRUE(std::holds_alternative<Loss::Details::CyclicalMAEDescriptor>(Loss::from_name("cyclical_mae_rad")));
    EXPECT_THROW((void)Loss::from_name("huber"), std::invalid_argument);
}

TEST(Loss, WeightedSumUsesTargetWeights) {
    const auto options = Test::small_options();
    const auto descriptors = Loss::from_options(options);

    const std::vector<torch::Tensor> predictions{
        torch::tensor({{0.0f, 0.0f}}), torch::tensor({{0.0f}}), torch::tensor({{1.0f}})};
    const std::vector<torch::Tensor> labels{
        torch::tensor({{3.0f, 4.0f}}), torch::tensor({{1.0f}}), torch::tensor({{0.0f}})};

    const auto total = Loss::weighted_sum(options, descriptors, predictions, labels);
    EXPECT_NEAR(total.item<double>(), 1.0 * 5.0 + 0.5 * 1.0 + 2.0 * 1.0, 1e-5);
}

TEST(Loss, TargetWithoutLossIsRejected) {
    EXPECT_THROW((void)Loss::from_options(Test::small_options({{"position", 2}})), std::invalid_argument);
}
