#ifndef HYDRA_LAYER_HPP
#define HYDRA_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <cstddef>
#include <cstdint>

#include "../activation/activation.hpp"
#include "../initialization/initialization.hpp"
#include "details/fc.hpp"
#include "details/mlp.hpp"
#include "details/recurrent.hpp"

namespace Hydra::Layer {
    using FCOptions = Details::FCOptions;
    using FCDescriptor = Details::FCDescriptor;

    using MlpOptions = Details::MlpOptions;
    using MlpDescriptor = Details::MlpDescriptor;
    using MlpHead = Details::MlpHead;

    using RecurrentCell = Details::RecurrentCell;
    using RecurrentOptions = Details::RecurrentOptions;
    using RecurrentState = Details::RecurrentState;
    using RecurrentEncoder = Details::RecurrentEncoder;

    [[nodiscard]] inline auto FC(const FCOptions& options,
                                 ::Hydra::Activation::Descriptor activation = ::Hydra::Activation::Identity,
                                 ::Hydra::Initialization::Descriptor initialization = ::Hydra::Initialization::Default) -> FCDescriptor {
        return {options, activation, initialization};
    }

    [[nodiscard]] inline auto Mlp(const MlpOptions& options,
                                  ::Hydra::Activation::Descriptor activation = ::Hydra::Activation::ReLU,
                                  ::Hydra::Initialization::Descriptor initialization = ::Hydra::Initialization::Default) -> MlpDescriptor {
        return {options, activation, initialization};
    }

    // Default head: hidden layers of width `in_features`, then a projection to `out_features`.
    [[nodiscard]] inline torch::nn::AnyModule make_head(std::int64_t in_features,
                                                        std::int64_t out_features,
                                                        std::size_t hidden_layers = 3)
    {
        return torch::nn::AnyModule(Details::MlpHead(Mlp({in_features, out_features, hidden_layers})));
    }
}

#endif //HYDRA_LAYER_HPP
