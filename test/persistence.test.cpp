#include <catch.hpp>

#include <filesystem>
#include <string>

#include "fixtures.hpp"

using Hydra::Model::Task;

namespace {
    std::filesystem::path scratch_directory(const std::string& name)
    {
        auto directory = std::filesystem::temp_directory_path() / ("hydra_" + name);
        std::filesystem::remove_all(directory);
        return directory;
    }
}

TEST_CASE("A saved backbone reloads into an identically configured one") {
    const auto directory = scratch_directory("save_load");
    const auto x = Fixtures::series();

    torch::manual_seed(1);
    auto original = Fixtures::nbeats({.n_features = 24, .n_out = 3});
    original->save(directory);
    REQUIRE(std::filesystem::exists(directory / Hydra::Model::kHyperparametersFile));
    REQUIRE(std::filesystem::exists(directory / Hydra::Model::kParametersFile));

    torch::manual_seed(2);
    auto restored = Fixtures::nbeats({.n_features = 24, .n_out = 3});
    REQUIRE_FALSE(torch::allclose(original->forward(x, Task::Forecast), restored->forward(x, Task::Forecast)));

    restored->freeze_featurizer();
    restored->load(directory);
    REQUIRE(torch::allclose(original->forward(x, Task::Forecast), restored->forward(x, Task::Forecast)));
    REQUIRE(torch::allclose(original->featurize(x), restored->featurize(x)));

    // Trainable flags belong to the live backbone, not to the archive.
    for (const auto& parameter : restored->featurizer_parameters()) {
        REQUIRE_FALSE(parameter.requires_grad());
    }
    REQUIRE_FALSE(restored->network()->terminal_block()->g_backcast()->weight.requires_grad());

    const auto hyperparameters = Hydra::Common::SaveLoad::read_json_file(directory / Hydra::Model::kHyperparametersFile);
    REQUIRE(hyperparameters.get<std::string>("n_stacks") == "2");
    REQUIRE(hyperparameters.get<std::string>("n_out") == "3");

    std::filesystem::remove_all(directory);
}

TEST_CASE("Loading into a differently prepared backbone fails") {
    const auto directory = scratch_directory("mismatch");

    auto original = Fixtures::recurrent({.n_classes = 3});
    original->save(directory);

    auto other = Fixtures::recurrent({.n_classes = 4});
    REQUIRE_THROWS_AS(other->load(directory), std::runtime_error);

    auto missing = Fixtures::recurrent({.n_classes = 3});
    REQUIRE_THROWS_AS(missing->load(directory / "absent"), std::runtime_error);

    std::filesystem::remove_all(directory);
}
