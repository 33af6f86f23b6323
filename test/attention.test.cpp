#include <catch.hpp>

#include <cstdint>
#include <vector>

#include "fixtures.hpp"

using Hydra::Model::Task;

TEST_CASE("Attention features are the time average of the encoder output") {
    auto backbone = Fixtures::attention({.n_features = Fixtures::kSpaceDim});
    REQUIRE(backbone->name() == "Transformer");

    const auto x = Fixtures::series();
    const auto features = backbone->featurize(x);
    REQUIRE(features.sizes().vec() == std::vector<std::int64_t>{Fixtures::kBatch, Fixtures::kSpaceDim});

    REQUIRE_THROWS_AS(backbone->prepare_to_featurize(Fixtures::kSpaceDim + 1), Hydra::ConfigurationError);
}

TEST_CASE("Attention forecasts a block of n_out steps") {
    auto backbone = Fixtures::attention({.n_classes = 4, .n_out = 6});
    const auto x = Fixtures::series(3);

    REQUIRE(backbone->forward(x, Task::Forecast).sizes().vec() == std::vector<std::int64_t>{3, 6, 3});
    REQUIRE(backbone->forward(x, Task::Classify).sizes().vec() == std::vector<std::int64_t>{3, 4});
    REQUIRE_THROWS_AS(backbone->featurize(x), Hydra::ReadinessError);
}

TEST_CASE("Attention heads must divide the space dimension") {
    Hydra::Model::AttentionBackboneOptions options{};
    options.common = Fixtures::common({.n_out = 1});
    options.n_layers = 1;
    options.dim_feedforward = 8;

    options.n_heads = 2;
    REQUIRE_THROWS_AS(Hydra::Model::AttentionBackbone(options), Hydra::ConfigurationError);

    options.n_heads = 3;
    REQUIRE_NOTHROW(Hydra::Model::AttentionBackbone(options));
}

TEST_CASE("Attention featurizer excludes the task heads") {
    auto backbone = Fixtures::attention({.n_classes = 2, .n_out = 2});

    backbone->freeze_featurizer();
    for (const auto& item : backbone->named_parameters()) {
        const bool in_encoder = item.key().rfind("encoder.", 0) == 0;
        REQUIRE(item.value().requires_grad() == !in_encoder);
    }

    backbone->unfreeze_featurizer();
    for (const auto& parameter : backbone->parameters()) {
        REQUIRE(parameter.requires_grad());
    }
}

TEST_CASE("Transformer encoder keeps the sequence geometry") {
    Hydra::Block::EncoderOptions options{};
    options.layers = 2;
    options.embed_dim = 4;
    options.num_heads = 2;
    options.dim_feedforward = 8;
    options.dropout = 0.0;
    Hydra::Block::TransformerEncoder encoder(options);

    const auto output = encoder->forward(torch::randn({3, 7, 4}));
    REQUIRE(output.sizes().vec() == std::vector<std::int64_t>{3, 7, 4});
    REQUIRE_THROWS_AS(encoder->forward(torch::randn({3, 7, 5})), Hydra::ShapeError);

    options.num_heads = 3;
    REQUIRE_THROWS_AS(Hydra::Block::TransformerEncoder(options), Hydra::ConfigurationError);
}
