#ifndef HYDRA_RELU_HPP
#define HYDRA_RELU_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Hydra::Activation::Details {
    struct ReLU {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::relu(std::move(input));
        }
    };
}

#endif //HYDRA_RELU_HPP
