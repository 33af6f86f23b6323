#ifndef HYDRA_TANH_HPP
#define HYDRA_TANH_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Hydra::Activation::Details {
    struct Tanh {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::tanh(std::move(input));
        }
    };
}

#endif //HYDRA_TANH_HPP
