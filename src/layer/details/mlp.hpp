#ifndef HYDRA_MLP_HPP
#define HYDRA_MLP_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../activation/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "fc.hpp"

namespace Hydra::Layer::Details {
    // Default task head: `hidden_layers` x (Linear(in, in) + activation) followed by Linear(in, out).
    struct MlpOptions {
        std::int64_t in_features{};
        std::int64_t out_features{};
        std::size_t hidden_layers{3};
        bool bias{true};
    };

    struct MlpDescriptor {
        MlpOptions options{};
        ::Hydra::Activation::Descriptor activation{::Hydra::Activation::ReLU};
        ::Hydra::Initialization::Descriptor initialization{::Hydra::Initialization::Default};
    };

    class MlpHeadImpl : public torch::nn::Module {
    public:
        explicit MlpHeadImpl(const MlpDescriptor& descriptor)
            : activation_(descriptor.activation.type)
        {
            const auto& options = descriptor.options;
            layers_.reserve(options.hidden_layers + 1);
            for (std::size_t index = 0; index <= options.hidden_layers; ++index) {
                const bool last = index == options.hidden_layers;
                FCDescriptor layer{{options.in_features, last ? options.out_features : options.in_features, options.bias},
                                   ::Hydra::Activation::Identity,
                                   descriptor.initialization};
                layers_.push_back(build_linear(*this, layer, "fc_" + std::to_string(index)));
            }
        }

        torch::Tensor forward(torch::Tensor input)
        {
            auto output = std::move(input);
            for (std::size_t index = 0; index < layers_.size(); ++index) {
                output = layers_[index]->forward(output);
                if (index + 1 < layers_.size()) {
                    output = ::Hydra::Activation::Details::apply(activation_, std::move(output));
                }
            }
            return output;
        }


    private:
        std::vector<torch::nn::Linear> layers_{};
        ::Hydra::Activation::Type activation_{::Hydra::Activation::Type::ReLU};
    };

    TORCH_MODULE(MlpHead);
}

#endif //HYDRA_MLP_HPP
