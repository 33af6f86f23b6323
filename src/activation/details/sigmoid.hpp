#ifndef HYDRA_SIGMOID_HPP
#define HYDRA_SIGMOID_HPP

#include <torch/torch.h>

#include <utility>

#include "../activation.hpp"

namespace Hydra::Activation::Details {
    struct Sigmoid {
        [[nodiscard]] torch::Tensor operator()(torch::Tensor input) const {
            return torch::sigmoid(std::move(input));
        }
    };
}

#endif //HYDRA_SIGMOID_HPP
