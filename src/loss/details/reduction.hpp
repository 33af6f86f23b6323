#ifndef HYDRA_LOSS_REDUCTION_HPP
#define HYDRA_LOSS_REDUCTION_HPP

#include <torch/torch.h>
#include <type_traits>

namespace Hydra::Loss::Details {

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
}

#endif // HYDRA_LOSS_REDUCTION_HPP
