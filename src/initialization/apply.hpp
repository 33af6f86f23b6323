#ifndef HYDRA_INITIALIZATION_APPLY_HPP
#define HYDRA_INITIALIZATION_APPLY_HPP
#include <torch/torch.h>

#include <algorithm>
#include <cctype>
#include <string>

#include "../common/error.hpp"
#include "initialization.hpp"

namespace Hydra::Initialization::Details {
    namespace detail {
        template <class Module>
        inline void zero_bias_if_present(const Module& module) {
            if constexpr (requires { module->bias; }) {
                if (module->bias.defined()) {
                    torch::nn::init::zeros_(module->bias);
                }
            }
        }
    }  // namespace detail

    template <class Module>
    inline void apply_module_initialization(const Module& module, ::Hydra::Initialization::Descriptor descriptor) {
        torch::NoGradGuard no_grad;
        switch (descriptor.type) {
            case ::Hydra::Initialization::Type::XavierNormal:
                torch::nn::init::xavier_normal_(module->weight);
                detail::zero_bias_if_present(module);
                break;
            case ::Hydra::Initialization::Type::XavierUniform:
                torch::nn::init::xavier_uniform_(module->weight);
                detail::zero_bias_if_present(module);
                break;
            case ::Hydra::Initialization::Type::KaimingNormal:
                torch::nn::init::kaiming_normal_(module->weight,
                                                 /*a=*/0.0,
                                                 torch::kFanIn,
                                                 torch::kReLU);
                detail::zero_bias_if_present(module);
                break;
            case ::Hydra::Initialization::Type::KaimingUniform:
                torch::nn::init::kaiming_uniform_(module->weight,
                                                  /*a=*/0.0,
                                                  torch::kFanIn,
                                                  torch::kReLU);
                detail::zero_bias_if_present(module);
                break;
            case ::Hydra::Initialization::Type::Orthogonal:
                torch::nn::init::orthogonal_(module->weight);
                detail::zero_bias_if_present(module);
                break;
            case ::Hydra::Initialization::Type::ZeroBias:
                detail::zero_bias_if_present(module);
                break;
            case ::Hydra::Initialization::Type::Default:
            default:
                break;
        }
    }

    inline ::Hydra::Initialization::Descriptor from_string(std::string name)
    {
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (name == "default") return ::Hydra::Initialization::Default;
        if (name == "xavier_normal") return ::Hydra::Initialization::XavierNormal;
        if (name == "xavier_uniform") return ::Hydra::Initialization::XavierUniform;
        if (name == "kaiming_normal") return ::Hydra::Initialization::KaimingNormal;
        if (name == "kaiming_uniform") return ::Hydra::Initialization::KaimingUniform;
        if (name == "zero_bias") return ::Hydra::Initialization::ZeroBias;
        if (name == "orthogonal") return ::Hydra::Initialization::Orthogonal;
        throw ::Hydra::ConfigurationError("Unsupported initialization: " + name);
    }
}
#endif // HYDRA_INITIALIZATION_APPLY_HPP
