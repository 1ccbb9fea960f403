#ifndef INSIGHT_LOSS_REDUCTION_HPP
#define INSIGHT_LOSS_REDUCTION_HPP

#include <torch/torch.h>
#include <type_traits>

namespace Insight::Loss::Details {

    enum class Reduction { Mean, Sum, None };

    // Use: to_torch_reduction<torch::nn::functional::MSELossFuncOptions>(Reduction::Mean)
    template <typename Options>
    inline typename Options::reduction_t to_torch_reduction(Reduction r) {
        using RT = typename Options::reduction_t;
        static_assert(!std::is_void_v<RT>, "Options must define nested type 'reduction_t'");

        switch (r) {
            case Reduction::Sum:  return RT{torch::kSum};
            case Reduction::None: return RT{torch::kNone};
            case Reduction::Mean:
            default:              return RT{torch::kMean};
        }
    }

    inline torch::Tensor apply_reduction(torch::Tensor loss, Reduction reduction) {
        switch (reduction) {
            case Reduction::None:
                return loss;
            case Reduction::Sum:
                return loss.sum();
            case Reduction::Mean:
            default:
                return loss.mean();
        }
    }

    // Labels of shape [B] against predictions of shape [B, 1] (or the reverse) after head squeezing.
    inline torch::Tensor align_target(const torch::Tensor& prediction, const torch::Tensor& target) {
        auto aligned = target.to(prediction.device(), prediction.scalar_type());
        if (aligned.numel() == prediction.numel() && aligned.sizes() != prediction.sizes()) {
            aligned = aligned.reshape(prediction.sizes());
        }
        return aligned;
    }

}

#endif // INSIGHT_LOSS_REDUCTION_HPP
