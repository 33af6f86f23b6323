#ifndef HYDRA_FC_HPP
#define HYDRA_FC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/nn/module.h>
#include <torch/nn/modules/linear.h>
#include <torch/nn/options/linear.h>
#include "../../activation/activation.hpp"
#include "../../common/error.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"


namespace Hydra::Layer::Details {
    struct FCOptions {
        std::int64_t in_features{};
        std::int64_t out_features{};
        bool bias{true};
    };

    struct FCDescriptor {
        FCOptions options;
        ::Hydra::Activation::Descriptor activation{::Hydra::Activation::Identity};
        ::Hydra::Initialization::Descriptor initialization{::Hydra::Initialization::Default};
    };

    [[nodiscard]] inline torch::nn::Linear make_linear(const FCDescriptor& descriptor)
    {
        if (descriptor.options.in_features <= 0 || descriptor.options.out_features <= 0) {
            throw ::Hydra::ConfigurationError("Fully connected layers require positive in/out features (got "
                                              + std::to_string(descriptor.options.in_features) + " -> "
                                              + std::to_string(descriptor.options.out_features) + ").");
        }

        auto options = torch::nn::LinearOptions(descriptor.options.in_features, descriptor.options.out_features)
                            .bias(descriptor.options.bias);
        auto module = torch::nn::Linear(options);
        ::Hydra::Initialization::Details::apply_module_initialization(module, descriptor.initialization);
        return module;
    }

    template <class Owner>
    torch::nn::Linear build_linear(Owner& owner, const FCDescriptor& descriptor, const std::string& name)
    {
        return owner.register_module(name, make_linear(descriptor));
    }
}

#endif //HYDRA_FC_HPP
