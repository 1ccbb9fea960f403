#ifndef INSIGHT_TIME_DISTRIBUTED_HPP
#define INSIGHT_TIME_DISTRIBUTED_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Insight::Layer::Details {

    // Applies the wrapped module independently to every slice of dim 1 by folding
    // that axis into the batch: [B, T, ...] -> [B*T, ...] -> module -> [B, T, ...].
    class TimeDistributedImpl : public torch::nn::Module {
    public:
        explicit TimeDistributedImpl(torch::nn::AnyModule module)
            : module_(std::move(module))
        {
            TORCH_CHECK(!module_.is_empty(), "TimeDistributed requires a wrapped module.");
            register_module("module", module_.ptr());
        }

        torch::Tensor forward(torch::Tensor input)
        {
            if (input.dim() <= 2) {
                return module_.forward(std::move(input));
            }

            const auto outer = input.size(0);
            const auto distributed = input.size(1);
            auto output = module_.forward(input.flatten(0, 1));

            std::vector<std::int64_t> shape{outer, distributed};
            shape.insert(shape.end(), output.sizes().begin() + 1, output.sizes().end());
            return output.reshape(shape);
        }

        [[nodiscard]] const torch::nn::AnyModule& module() const noexcept { return module_; }

    private:
        torch::nn::AnyModule module_{};
    };

    TORCH_MODULE(TimeDistributed);

}

#endif //INSIGHT_TIME_DISTRIBUTED_HPP
