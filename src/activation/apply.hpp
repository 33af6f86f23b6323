#ifndef HYDRA_ACTIVATION_APPLY_HPP
#define HYDRA_ACTIVATION_APPLY_HPP

#include <torch/torch.h>

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include "../common/error.hpp"
#include "activation.hpp"
#include "details/gelu.hpp"
#include "details/relu.hpp"
#include "details/sigmoid.hpp"
#include "details/tanh.hpp"

namespace Hydra::Activation::Details {
    inline torch::Tensor apply(::Hydra::Activation::Type type, torch::Tensor input) {
        switch (type) {
            case ::Hydra::Activation::Type::ReLU:
                return ReLU{}(std::move(input));
            case ::Hydra::Activation::Type::Sigmoid:
                return Sigmoid{}(std::move(input));
            case ::Hydra::Activation::Type::Tanh:
                return Tanh{}(std::move(input));
            case ::Hydra::Activation::Type::GeLU:
                return GeLU{}(std::move(input));
            case ::Hydra::Activation::Type::Identity:
                return input;
            default:
                return input;
        }
    }

    inline ::Hydra::Activation::Descriptor from_string(std::string name)
    {
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (name == "identity" || name == "linear") {
            return ::Hydra::Activation::Identity;
        }
        if (name == "relu") {
            return ::Hydra::Activation::ReLU;
        }
        if (name == "sigmoid") {
            return ::Hydra::Activation::Sigmoid;
        }
        if (name == "tanh") {
            return ::Hydra::Activation::Tanh;
        }
        if (name == "gelu") {
            return ::Hydra::Activation::GeLU;
        }
        throw ::Hydra::ConfigurationError("Unsupported activation: " + name);
    }
}
#endif // HYDRA_ACTIVATION_APPLY_HPP
