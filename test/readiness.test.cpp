#include <catch.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "fixtures.hpp"

using Hydra::Model::Task;

TEST_CASE("Construction requires one task size and positive dimensions") {
    REQUIRE_THROWS_AS(Fixtures::recurrent({}), Hydra::ConfigurationError);

    Hydra::Model::RecurrentBackboneOptions options{};
    options.common = Fixtures::common({.n_out = 2});
    options.common.dimensions.n_in = 0;
    REQUIRE_THROWS_AS(Hydra::Model::RecurrentBackbone(options), Hydra::ConfigurationError);

    options.common.dimensions = {Fixtures::kInSteps, 0};
    REQUIRE_THROWS_AS(Hydra::Model::RecurrentBackbone(options), Hydra::ConfigurationError);
}

TEST_CASE("Tasks are prepared independently") {
    auto backbone = Fixtures::recurrent({.n_features = Fixtures::kHidden});
    REQUIRE(backbone->is_prepared_to_featurize());
    REQUIRE_FALSE(backbone->is_prepared_to_classify());
    REQUIRE_FALSE(backbone->is_prepared_to_forecast());

    SECTION("two classes is the minimum") {
        REQUIRE_THROWS_AS(backbone->prepare_to_classify(1), Hydra::ConfigurationError);
        REQUIRE_FALSE(backbone->is_prepared_to_classify());
        backbone->prepare_to_classify(2);
        REQUIRE(backbone->is_prepared_to_classify());
        REQUIRE(backbone->n_classes() == 2);
    }

    SECTION("forecast needs at least one step") {
        REQUIRE_THROWS_AS(backbone->prepare_to_forecast(0), Hydra::ConfigurationError);
        backbone->prepare_to_forecast(1);
        REQUIRE(backbone->is_prepared_to_forecast());
    }

    SECTION("preparing one task leaves the others alone") {
        backbone->prepare_to_forecast(4);
        REQUIRE_FALSE(backbone->is_prepared_to_classify());
        REQUIRE(backbone->n_features() == Fixtures::kHidden);
    }
}

TEST_CASE("Dispatch checks readiness before running a task") {
    auto backbone = Fixtures::recurrent({.n_features = Fixtures::kHidden});
    const auto x = Fixtures::series();

    REQUIRE_THROWS_AS(backbone->forward(x, Task::Forecast), Hydra::ReadinessError);
    REQUIRE_THROWS_AS(backbone->forward(x, Task::Classify), Hydra::ReadinessError);
    REQUIRE_THROWS_AS(backbone->classify(x), Hydra::ReadinessError);
    REQUIRE_THROWS_AS(backbone->forecast_in_chunks(x, 3), Hydra::ReadinessError);

    const auto features = backbone->forward(x, Task::Featurize);
    REQUIRE(features.sizes().vec() == std::vector<std::int64_t>{Fixtures::kBatch, Fixtures::kHidden});
}

TEST_CASE("Dispatch rejects inputs of the wrong geometry") {
    auto backbone = Fixtures::recurrent({.n_features = Fixtures::kHidden});

    REQUIRE_THROWS_AS(backbone->featurize(Fixtures::series(2, Fixtures::kInSteps, 4)), Hydra::ShapeError);
    REQUIRE_THROWS_AS(backbone->featurize(Fixtures::series(2, 6, Fixtures::kSpaceDim)), Hydra::ShapeError);
    REQUIRE_THROWS_AS(backbone->featurize(torch::randn({2, Fixtures::kInSteps})), Hydra::ShapeError);
}

TEST_CASE("Re-preparing a task warns and replaces the head") {
    std::ostringstream captured;
    Hydra::Utils::Log::ScopedStream redirect(&captured);

    auto backbone = Fixtures::recurrent({.n_classes = 3});
    REQUIRE(captured.str().empty());

    backbone->prepare_to_classify(4);
    REQUIRE(captured.str().find("Warning: this GRU is already prepared to classify") != std::string::npos);

    const auto logits = backbone->forward(Fixtures::series(), Task::Classify);
    REQUIRE(logits.size(1) == 4);
}

TEST_CASE("An invalid re-preparation is rejected without a warning") {
    std::ostringstream captured;
    Hydra::Utils::Log::ScopedStream redirect(&captured);

    auto backbone = Fixtures::recurrent({.n_classes = 3});
    REQUIRE_THROWS_AS(backbone->prepare_to_classify(1), Hydra::ConfigurationError);
    REQUIRE(captured.str().empty());
    REQUIRE(backbone->n_classes().value() == 3);
}

TEST_CASE("A head of the wrong width breaks the output postcondition") {
    auto backbone = Fixtures::recurrent({.n_features = Fixtures::kHidden});
    backbone->prepare_to_classify(2, torch::nn::AnyModule(torch::nn::Linear(Fixtures::kHidden, 3)));
    REQUIRE_THROWS_AS(backbone->forward(Fixtures::series(), Task::Classify), Hydra::ShapeError);
}

TEST_CASE("classify returns one class index per sample") {
    auto backbone = Fixtures::attention({.n_classes = 3});
    const auto prediction = backbone->classify(Fixtures::series(4));

    REQUIRE(prediction.sizes().vec() == std::vector<std::int64_t>{4});
    REQUIRE(prediction.scalar_type() == torch::kLong);
    REQUIRE(prediction.min().item<std::int64_t>() >= 0);
    REQUIRE(prediction.max().item<std::int64_t>() < 3);
}

TEST_CASE("Readiness markers validate sizes and report re-marking") {
    Hydra::Model::TaskReadiness readiness;
    REQUIRE_FALSE(readiness.prepared(Task::Featurize));
    REQUIRE_THROWS_AS(readiness.mark(Task::Featurize, 0), Hydra::ConfigurationError);
    REQUIRE_FALSE(readiness.mark(Task::Featurize, 3));
    REQUIRE(readiness.mark(Task::Featurize, 5));
    REQUIRE(readiness.n_features() == 5);
}
