#include <catch.hpp>

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "fixtures.hpp"

using Hydra::Common::Config;

TEST_CASE("Config reads typed values with fallbacks") {
    const auto config = Config::from_json_string(R"({
        "n_in": 10,
        "space_dim": 3,
        "n_classes": null,
        "model": "LSTM",
        "dropout": 0.25
    })");

    REQUIRE(config.require<std::int64_t>("n_in") == 10);
    REQUIRE(config.get<std::int64_t>("n_layers", 2) == 2);
    REQUIRE(config.get<std::string>("model", "GRU") == "LSTM");
    REQUIRE(config.get<double>("dropout", 0.0) == Approx(0.25));
    REQUIRE_FALSE(config.find<std::int64_t>("n_classes").has_value());
    REQUIRE_FALSE(config.contains("n_classes"));
    REQUIRE(config.contains("space_dim"));

    REQUIRE_THROWS_AS(config.require<std::int64_t>("n_out"), Hydra::ConfigurationError);
    REQUIRE_THROWS_AS(config.require<std::int64_t>("model"), Hydra::ConfigurationError);
}

TEST_CASE("Config reports the keys nobody read") {
    const auto config = Config::from_json_string(R"({"n_in": 4, "space_dim": 2, "bias": false, "foo": "bar"})");
    (void)config.get<std::int64_t>("n_in", 0);
    (void)config.get<std::int64_t>("space_dim", 0);

    const auto rest = config.unconsumed();
    REQUIRE(rest.size() == 2);
    REQUIRE(rest.get<bool>("bias") == false);
    REQUIRE(rest.get<std::string>("foo") == "bar");
}

TEST_CASE("Config lists broadcast scalars") {
    const auto config = Config::from_json_string(R"({"one": 64, "many": [8, 16, 32], "bad": ["x"]})");

    REQUIRE(config.get_list("one", 3, 0) == std::vector<std::int64_t>{64, 64, 64});
    REQUIRE(config.get_list("many", 3, 0) == std::vector<std::int64_t>{8, 16, 32});
    REQUIRE(config.get_list("missing", 2, 5) == std::vector<std::int64_t>{5, 5});
    REQUIRE_THROWS_AS(config.get_list("many", 2, 0), Hydra::ConfigurationError);
    REQUIRE_THROWS_AS(config.get_list("bad", 1, 0), Hydra::ConfigurationError);
}

TEST_CASE("Config rejects malformed documents") {
    REQUIRE_THROWS_AS(Config::from_json_string("{\"n_in\": "), Hydra::ConfigurationError);
    REQUIRE_THROWS_AS(Config::from_json_file("/nonexistent/hydra.json"), Hydra::ConfigurationError);
}

TEST_CASE("Config can be assembled in code") {
    Config config;
    config.set("n_in", 5).set("space_dim", 3).set_list("layer_widths", {4, 8});
    REQUIRE(config.require<std::int64_t>("space_dim") == 3);
    REQUIRE(config.get_list("layer_widths", 2, 0) == std::vector<std::int64_t>{4, 8});
}

TEST_CASE("Hyperparameters record construction and preparation values") {
    auto backbone = Fixtures::recurrent({.n_features = Fixtures::kHidden});
    const auto& hyperparameters = backbone->hyperparameters();

    REQUIRE(hyperparameters.get<std::int64_t>("n_in") == Fixtures::kInSteps);
    REQUIRE(hyperparameters.get<std::string>("model") == std::string("GRU"));
    REQUIRE(hyperparameters.get<std::string>("forecast_type") == std::string("one_by_one"));
    REQUIRE(hyperparameters.get<std::string>("n_out") == std::string("null"));

    backbone->prepare_to_forecast(6);
    REQUIRE(hyperparameters.get<std::int64_t>("n_out") == 6);

    const auto json = hyperparameters.to_json();
    REQUIRE(json.find("\"n_hidden\"") != std::string::npos);
    REQUIRE(json.find("\"space_dim\"") != std::string::npos);
}

TEST_CASE("Log messages go to the configured stream") {
    std::ostringstream captured;
    {
        Hydra::Utils::Log::ScopedStream redirect(&captured);
        Hydra::Utils::Log::info("hello");
        Hydra::Utils::Log::warning("careful");
    }
    REQUIRE(captured.str() == "[Hydra] Info: hello\n[Hydra] Warning: careful\n");

    Hydra::Utils::Log::info("after scope");
    REQUIRE(captured.str().find("after scope") == std::string::npos);
}

TEST_CASE("Colored warnings carry the terminal palette") {
    std::ostringstream captured;
    {
        Hydra::Utils::Log::ScopedStream redirect(&captured);
        Hydra::Utils::Log::set_colors(true);
        Hydra::Utils::Log::warning("careful");
    }
    const auto text = captured.str();
    REQUIRE(text.find(Hydra::Utils::Terminal::Colors::kOrange) == 0);
    REQUIRE(text.find("[Hydra] Warning:") != std::string::npos);
    REQUIRE(text.find(Hydra::Utils::Terminal::Colors::kReset) != std::string::npos);
}
