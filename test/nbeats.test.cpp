#include <catch.hpp>

#include <cstdint>
#include <set>
#include <sstream>
#include <vector>

#include "fixtures.hpp"

using Hydra::Model::Task;

namespace {
    constexpr std::int64_t kFeatureWidth = 2 * 3 * 4;

    std::set<const c10::TensorImpl*> identities(const std::vector<torch::Tensor>& parameters)
    {
        std::set<const c10::TensorImpl*> ids;
        for (const auto& parameter : parameters) {
            ids.insert(parameter.unsafeGetTensorImpl());
        }
        return ids;
    }
}

TEST_CASE("N-BEATS feature width does not depend on the horizon") {
    std::ostringstream silenced;
    Hydra::Utils::Log::ScopedStream redirect(&silenced);

    auto backbone = Fixtures::nbeats({.n_features = kFeatureWidth, .n_out = 2});
    REQUIRE(backbone->name() == "N-BEATS");
    const auto x = Fixtures::series();

    REQUIRE(backbone->featurize(x).sizes().vec() == std::vector<std::int64_t>{2, kFeatureWidth});
    REQUIRE(backbone->forward(x, Task::Forecast).sizes().vec() == std::vector<std::int64_t>{2, 2, 3});

    backbone->prepare_to_forecast(7);
    REQUIRE(backbone->featurize(x).sizes().vec() == std::vector<std::int64_t>{2, kFeatureWidth});
    REQUIRE(backbone->forward(x, Task::Forecast).sizes().vec() == std::vector<std::int64_t>{2, 7, 3});

    REQUIRE_THROWS_AS(backbone->prepare_to_featurize(kFeatureWidth - 1), Hydra::ConfigurationError);
}

TEST_CASE("N-BEATS featurizes without a forecast horizon") {
    auto backbone = Fixtures::nbeats({.n_features = kFeatureWidth});
    const auto x = Fixtures::series();
    REQUIRE(backbone->featurize(x).size(1) == kFeatureWidth);
    REQUIRE_THROWS_AS(backbone->forward(x, Task::Forecast), Hydra::ReadinessError);

    Hydra::Block::NBeatsOptions options{};
    options.n_in = 15;
    Hydra::Block::NBeatsNetwork network(options);
    REQUIRE(network->featurize(torch::randn({2, 15})).size(1) == 5);
    REQUIRE_THROWS_AS(network->forward(torch::randn({2, 15})), Hydra::ReadinessError);
    REQUIRE_THROWS_AS(network->featurize(torch::randn({2, 14})), Hydra::ShapeError);
}

TEST_CASE("N-BEATS classifies on top of its features") {
    SECTION("featurize must come first") {
        auto backbone = Fixtures::nbeats({.n_out = 2});
        REQUIRE_THROWS_AS(backbone->prepare_to_classify(3), Hydra::OrderingError);
        REQUIRE_FALSE(backbone->is_prepared_to_classify());

        backbone->prepare_to_featurize(kFeatureWidth);
        backbone->prepare_to_classify(3);
        REQUIRE(backbone->classify(Fixtures::series()).size(0) == Fixtures::kBatch);
    }

    SECTION("construction follows the same order") {
        REQUIRE_THROWS_AS(Fixtures::nbeats({.n_classes = 3}), Hydra::OrderingError);
        auto backbone = Fixtures::nbeats({.n_classes = 3, .n_features = kFeatureWidth});
        REQUIRE(backbone->forward(Fixtures::series(), Task::Classify).size(1) == 3);
    }
}

TEST_CASE("N-BEATS forecast is the sum of its block forecasts") {
    auto backbone = Fixtures::nbeats({.n_out = 4});
    Fixtures::fix_weights(*backbone);
    const auto x = Fixtures::series();

    const auto total = backbone->forward(x, Task::Forecast);
    const auto parts = backbone->block_forecasts(x);
    REQUIRE(parts.size() == 6);

    auto sum = torch::zeros_like(total);
    for (const auto& part : parts) {
        REQUIRE(part.sizes().vec() == total.sizes().vec());
        sum = sum + part;
    }
    REQUIRE(torch::allclose(sum, total, 1e-5, 1e-6));
}

TEST_CASE("N-BEATS features are the forecast expansions of the residual pass") {
    std::ostringstream silenced;
    Hydra::Utils::Log::ScopedStream redirect(&silenced);

    auto backbone = Fixtures::nbeats({.n_features = kFeatureWidth, .n_out = 2});
    Fixtures::fix_weights(*backbone);
    const auto x = torch::arange(2 * Fixtures::kInSteps * Fixtures::kSpaceDim, torch::kFloat)
                       .reshape({2, Fixtures::kInSteps, Fixtures::kSpaceDim})
                       .mul(0.1)
                       .sin();

    torch::NoGradGuard no_grad;
    auto residual = x.reshape({2, -1});
    REQUIRE(torch::equal(residual.select(1, 1 * Fixtures::kSpaceDim + 2), x.select(1, 1).select(1, 2)));

    std::vector<torch::Tensor> expected;
    auto& network = backbone->network();
    for (const auto& stack : network->stacks()) {
        for (const auto& block : stack->blocks()) {
            auto expansions = block->expansions(residual);
            residual = residual - block->g_backcast()->forward(expansions.backcast);
            expected.push_back(expansions.forecast);
        }
    }
    REQUIRE(torch::allclose(backbone->featurize(x), torch::cat(expected, 1), 1e-5, 1e-6));

    SECTION("forecasts are reshaped back channel by channel") {
        const auto flat = network->forward(x.reshape({2, -1}));
        const auto forecast = backbone->forward(x, Task::Forecast);
        REQUIRE(torch::allclose(forecast, flat.reshape({2, -1, Fixtures::kSpaceDim})));
        REQUIRE(forecast[1][1][0].item<float>() == Approx(flat[1][1 * Fixtures::kSpaceDim].item<float>()));
    }
}

TEST_CASE("N-BEATS block forecasts check the input window") {
    auto backbone = Fixtures::nbeats({.n_out = 2});
    REQUIRE_THROWS_AS(backbone->block_forecasts(torch::randn({2, Fixtures::kSpaceDim, Fixtures::kInSteps})),
                      Hydra::ShapeError);
    REQUIRE_THROWS_AS(backbone->block_forecasts(torch::randn({2, Fixtures::kInSteps * Fixtures::kSpaceDim, 1})),
                      Hydra::ShapeError);
}

TEST_CASE("The terminal backcast path stays frozen") {
    auto backbone = Fixtures::nbeats({.n_features = kFeatureWidth, .n_out = 2});
    auto& network = backbone->network();
    auto terminal = network->terminal_block();

    REQUIRE_FALSE(terminal->g_backcast()->weight.requires_grad());
    REQUIRE_FALSE(terminal->backcast_expansion()->weight.requires_grad());
    REQUIRE(terminal->g_forecast()->weight.requires_grad());
    REQUIRE(terminal->forecast_expansion()->weight.requires_grad());

    const auto& first = network->stacks().front()->blocks().front();
    REQUIRE(first->g_backcast()->weight.requires_grad());

    backbone->freeze_featurizer();
    backbone->unfreeze_featurizer();
    REQUIRE_FALSE(terminal->g_backcast()->weight.requires_grad());
    REQUIRE_FALSE(terminal->backcast_expansion()->bias.requires_grad());
}

TEST_CASE("N-BEATS featurizer leaves the forecast generators trainable") {
    auto backbone = Fixtures::nbeats({.n_features = kFeatureWidth, .n_out = 2});
    auto& network = backbone->network();
    const auto featurizer = identities(backbone->featurizer_parameters());

    for (const auto& stack : network->stacks()) {
        for (const auto& block : stack->blocks()) {
            REQUIRE(featurizer.count(block->g_forecast()->weight.unsafeGetTensorImpl()) == 0);
            REQUIRE(featurizer.count(block->fc_stack().front()->weight.unsafeGetTensorImpl()) == 1);
            REQUIRE(featurizer.count(block->forecast_expansion()->weight.unsafeGetTensorImpl()) == 1);
        }
    }
    auto terminal = network->terminal_block();
    REQUIRE(featurizer.count(terminal->g_backcast()->weight.unsafeGetTensorImpl()) == 0);

    backbone->freeze_featurizer();
    for (const auto& parameter : backbone->featurizer_parameters()) {
        REQUIRE_FALSE(parameter.requires_grad());
    }
    for (const auto& stack : network->stacks()) {
        for (const auto& block : stack->blocks()) {
            REQUIRE(block->g_forecast()->weight.requires_grad());
        }
    }
}

TEST_CASE("N-BEATS layer widths are per stack") {
    auto options = Fixtures::nbeats_options({.n_out = 1});
    options.layer_widths = {8, 12};
    auto backbone = Hydra::Model::NBeatsBackbone(options);
    const auto& stacks = backbone->network()->stacks();
    REQUIRE(stacks[0]->blocks()[0]->options().layer_width == 8);
    REQUIRE(stacks[1]->blocks()[0]->options().layer_width == 12);

    options.layer_widths = {8, 12, 16};
    REQUIRE_THROWS_AS(Hydra::Model::NBeatsBackbone(options), Hydra::ConfigurationError);
}

TEST_CASE("N-BEATS trunk initialization is configurable") {
    auto options = Fixtures::nbeats_options({.n_out = 1});
    options.common.extra.put("initialization", "zero_bias");
    auto backbone = Hydra::Model::NBeatsBackbone(options);
    for (const auto& stack : backbone->network()->stacks()) {
        for (const auto& block : stack->blocks()) {
            for (const auto& layer : block->fc_stack()) {
                REQUIRE(layer->bias.abs().sum().item<double>() == Approx(0.0));
            }
        }
    }

    options.common.extra.put("initialization", "glorot");
    REQUIRE_THROWS_AS(Hydra::Model::NBeatsBackbone(options), Hydra::ConfigurationError);
}
