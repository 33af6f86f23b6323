#ifndef HYDRA_TEST_FIXTURES_HPP
#define HYDRA_TEST_FIXTURES_HPP

#include <cstdint>

#include <torch/torch.h>

#include "../include/Hydra.h"

namespace Fixtures {
    inline constexpr std::int64_t kBatch = 2;
    inline constexpr std::int64_t kInSteps = 5;
    inline constexpr std::int64_t kSpaceDim = 3;
    inline constexpr std::int64_t kHidden = 8;

    inline torch::Tensor series(std::int64_t batch = kBatch,
                                std::int64_t steps = kInSteps,
                                std::int64_t space_dim = kSpaceDim)
    {
        return torch::randn({batch, steps, space_dim});
    }

    inline Hydra::Model::BackboneOptions common(Hydra::Model::TaskSizes sizes, std::size_t head_layers = 1)
    {
        Hydra::Model::BackboneOptions options{};
        options.dimensions = {kInSteps, kSpaceDim};
        options.sizes = sizes;
        options.head_layers = head_layers;
        return options;
    }

    inline Hydra::Model::RecurrentBackbone recurrent(Hydra::Model::TaskSizes sizes,
                                                     Hydra::Model::ForecastType type = Hydra::Model::ForecastType::OneByOne,
                                                     Hydra::Layer::RecurrentCell cell = Hydra::Layer::RecurrentCell::GRU)
    {
        Hydra::Model::RecurrentBackboneOptions options{};
        options.common = common(sizes);
        options.model = cell;
        options.n_layers = 1;
        options.n_hidden = kHidden;
        options.forecast_type = type;
        return Hydra::Model::RecurrentBackbone(options);
    }

    inline Hydra::Model::AttentionBackbone attention(Hydra::Model::TaskSizes sizes)
    {
        Hydra::Model::AttentionBackboneOptions options{};
        options.common = common(sizes);
        options.n_layers = 1;
        options.n_heads = 1;
        options.dim_feedforward = 16;
        options.dropout = 0.0;
        return Hydra::Model::AttentionBackbone(options);
    }

    inline Hydra::Model::NBeatsBackboneOptions nbeats_options(Hydra::Model::TaskSizes sizes)
    {
        Hydra::Model::NBeatsBackboneOptions options{};
        options.common = common(sizes);
        options.n_stacks = 2;
        options.n_blocks = 3;
        options.n_layers = 2;
        options.expansion_coefficient_dim = 4;
        options.layer_widths = {16};
        return options;
    }

    inline Hydra::Model::NBeatsBackbone nbeats(Hydra::Model::TaskSizes sizes)
    {
        return Hydra::Model::NBeatsBackbone(nbeats_options(sizes));
    }

    // Overwrites every parameter with a fixed ramp so results do not depend on the random initialisation.
    inline void fix_weights(torch::nn::Module& module)
    {
        torch::NoGradGuard guard;
        std::int64_t offset = 0;
        for (auto& parameter : module.parameters()) {
            const auto count = parameter.numel();
            auto ramp = torch::arange(offset, offset + count, torch::kFloat).remainder(7.0).sub(3.0).mul(0.05);
            parameter.copy_(ramp.reshape(parameter.sizes()));
            offset += count;
        }
    }
}

#endif // HYDRA_TEST_FIXTURES_HPP
