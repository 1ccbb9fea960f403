#ifndef INSIGHT_TEST_FIXTURES_HPP
#define INSIGHT_TEST_FIXTURES_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../../include/Insight.h"

namespace Insight::Test {
    // 16-step windows over 8 bands: three conv rounds bring the frequency axis to 1,
    // so every head sees a single distributed step.
    inline Options small_options(std::vector<TargetOptions> targets = {
                                     {"position", 2, "euclidean", 1.0},
                                     {"direction", 1, "cyclical_mae_rad", 0.5},
                                     {"speed", 1, "mae", 2.0}})
    {
        Options options{};
        options.model_timesteps = 16;
        options.num_cvs = 4;
        options.targets = std::move(targets);
        options.num_convs_tsr = 3;
        options.filter_size = 4;
        options.kernel_size = 3;
        options.act_conv = "ELU";
        options.act_fc = "ReLU";
        options.num_dense = 1;
        options.num_units_dense = 8;
        options.dropout_ratio = 0.25;
        options.batch_size = 4;
        return options;
    }

    inline Data::Recording small_recording(double step_x = 1.0, double step_y = 0.0, double origin_y = 0.0)
    {
        Data::SyntheticOptions synthetic{};
        synthetic.length = 128;
        synthetic.frequencies = 8;
        synthetic.channels = 4;
        synthetic.step_x = step_x;
        synthetic.step_y = step_y;
        synthetic.origin_y = origin_y;
        synthetic.seed = 7;
        return Data::Synthetic(synthetic);
    }

    inline std::vector<std::int64_t> small_input_shape()
    {
        return {4, 16, 8, 1};
    }
}

#endif // INSIGHT_TEST_FIXTURES_HPP
