#ifndef HYDRA_MODEL_RECURRENT_HPP
#define HYDRA_MODEL_RECURRENT_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../forecast/horizon.hpp"
#include "../layer/layer.hpp"
#include "backbone.hpp"

namespace Hydra::Model {
    // Width of the forecaster head: one step (OneByOne) or the full n_out block (Multi).
    enum class ForecastType {
        Multi,
        OneByOne,
    };

    inline std::string to_string(ForecastType type)
    {
        switch (type) {
            case ForecastType::Multi: return "multi";
            case ForecastType::OneByOne: return "one_by_one";
        }
        return "one_by_one";
    }

    inline ForecastType forecast_type_from_string(std::string name)
    {
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (name == "multi") {
            return ForecastType::Multi;
        }
        if (name == "one_by_one") {
            return ForecastType::OneByOne;
        }
        throw ConfigurationError("`forecast_type` must be `multi` or `one_by_one` (got '" + name + "').");
    }

    struct RecurrentBackboneOptions {
        BackboneOptions common{};
        Layer::RecurrentCell model{Layer::RecurrentCell::GRU};
        std::int64_t n_layers{1};
        std::int64_t n_hidden{32};
        ForecastType forecast_type{ForecastType::OneByOne};
    };

    inline RecurrentBackboneOptions recurrent_options_from_config(const Common::Config& config)
    {
        RecurrentBackboneOptions options{};
        options.common = backbone_options_from_config(config);
        options.model = Layer::Details::recurrent_cell_from_string(config.get<std::string>("model", "GRU"));
        options.n_layers = config.get<std::int64_t>("n_layers", options.n_layers);
        options.n_hidden = config.get<std::int64_t>("n_hidden", options.n_hidden);
        options.forecast_type = forecast_type_from_string(config.get<std::string>("forecast_type", "one_by_one"));
        options.common.extra = config.unconsumed();
        return options;
    }

    // GRU or LSTM backbone. Features are the last hidden output, so n_features is always n_hidden.
    class RecurrentBackboneImpl : public Backbone {
    public:
        explicit RecurrentBackboneImpl(RecurrentBackboneOptions options)
            : Backbone(options.common), options_(std::move(options))
        {
            Common::check_int_arg(options_.n_layers, 1, "number of recurrent layers");
            Common::check_int_arg(options_.n_hidden, 1, "number of hidden units");

            const auto& extra = backbone_options().extra;
            Layer::RecurrentOptions encoder_options{};
            encoder_options.cell = options_.model;
            encoder_options.input_size = space_dim();
            encoder_options.hidden_size = options_.n_hidden;
            encoder_options.num_layers = options_.n_layers;
            encoder_options.dropout = extra.get<double>("dropout", 0.0);
            encoder_options.bias = extra.get<bool>("bias", true);
            note_ignored_extra({"dropout", "bias"});

            auto& hyperparameters = mutable_hyperparameters();
            hyperparameters.record("model", Layer::Details::to_string(options_.model));
            hyperparameters.record("n_layers", options_.n_layers);
            hyperparameters.record("n_hidden", options_.n_hidden);
            hyperparameters.record("forecast_type", to_string(options_.forecast_type));
            hyperparameters.record_all(extra);

            rnn_ = register_module("rnn", Layer::RecurrentEncoder(encoder_options));

            prepare_requested_tasks({Task::Featurize, Task::Classify, Task::Forecast});
        }

        [[nodiscard]] std::string name() const override { return Layer::Details::to_string(options_.model); }

        void prepare_to_classify(std::int64_t n_classes,
                                 std::optional<torch::nn::AnyModule> head = std::nullopt) override
        {
            mark_prepared(Task::Classify, n_classes);
            install_head(kClassifierHead, std::move(head), options_.n_hidden, n_classes);
        }

        void prepare_to_featurize(std::int64_t n_features) override
        {
            if (n_features != options_.n_hidden) {
                throw ConfigurationError("The current implementation of " + name()
                                         + " only accepts `n_hidden` (" + std::to_string(options_.n_hidden)
                                         + ") as the number of features (got " + std::to_string(n_features) + ").");
            }
            mark_prepared(Task::Featurize, n_features);
        }

        void prepare_to_forecast(std::int64_t n_out,
                                 std::optional<torch::nn::AnyModule> head = std::nullopt) override
        {
            mark_prepared(Task::Forecast, n_out);
            const auto steps = options_.forecast_type == ForecastType::OneByOne ? 1 : n_out;
            install_head(kForecasterHead, std::move(head), options_.n_hidden, steps * space_dim());
        }

        // Multi primitive: the whole n_out block from the last hidden output.
        torch::Tensor forecast_multi_all(const torch::Tensor& input)
        {
            check_input(input);
            require_forecast_type_(ForecastType::Multi, "forecast_multi_all");
            return apply_head(kForecasterHead, forward_featurize(input))
                .reshape({input.size(0), *n_out(), space_dim()});
        }

        torch::Tensor forecast_recurrently_one_by_one(const torch::Tensor& input, std::int64_t n)
        {
            check_input(input);
            require_forecast_type_(ForecastType::OneByOne, "forecast_recurrently_one_by_one");
            return Forecast::recurrent_autoregression(input, n, rnn_, [this](const torch::Tensor& hidden) {
                return apply_head(kForecasterHead, hidden);
            });
        }

        // Keeps only the first of the n_out predicted steps before feeding it back.
        torch::Tensor forecast_recurrently_multi_first(const torch::Tensor& input, std::int64_t n)
        {
            check_input(input);
            require_forecast_type_(ForecastType::Multi, "forecast_recurrently_multi_first");
            const auto batch = input.size(0);
            return Forecast::recurrent_autoregression(input, n, rnn_, [this, batch](const torch::Tensor& hidden) {
                return apply_head(kForecasterHead, hidden).reshape({batch, *n_out(), space_dim()}).select(1, 0);
            });
        }

        [[nodiscard]] ForecastStrategies forecast_strategies() override
        {
            auto strategies = Backbone::forecast_strategies();
            if (options_.forecast_type == ForecastType::OneByOne) {
                strategies.emplace("one_by_one", [this](const torch::Tensor& input, std::int64_t n) {
                    return forecast_recurrently_one_by_one(input, n);
                });
            } else {
                strategies.emplace("multi", [this](const torch::Tensor& input, std::int64_t n) {
                    return forecast_recurrently_multi_first(input, n);
                });
            }
            return strategies;
        }

        [[nodiscard]] std::vector<torch::Tensor> featurizer_parameters() override { return rnn_->parameters(); }

        [[nodiscard]] ForecastType forecast_type() const noexcept { return options_.forecast_type; }
        [[nodiscard]] std::int64_t n_hidden() const noexcept { return options_.n_hidden; }
        [[nodiscard]] const RecurrentBackboneOptions& options() const noexcept { return options_; }

    protected:
        torch::Tensor forward_classify(const torch::Tensor& input) override
        {
            return apply_head(kClassifierHead, forward_featurize(input));
        }

        torch::Tensor forward_featurize(const torch::Tensor& input) override
        {
            auto [output, state] = rnn_->forward(input);
            return output.select(1, -1);
        }

        torch::Tensor forward_forecast(const torch::Tensor& input) override
        {
            if (options_.forecast_type == ForecastType::Multi) {
                return forecast_multi_all(input);
            }
            return forecast_recurrently_one_by_one(input, *n_out()).narrow(1, n_in(), *n_out());
        }

    private:
        void require_forecast_type_(ForecastType expected, const std::string& function) const
        {
            if (!is_prepared_to_forecast()) {
                throw ReadinessError(name() + " was not prepared to forecast.");
            }
            if (options_.forecast_type != expected) {
                throw StrategyError(function + " requires forecast type `" + to_string(expected) + "` but "
                                    + name() + " uses `" + to_string(options_.forecast_type) + "`.");
            }
        }

        RecurrentBackboneOptions options_{};
        Layer::RecurrentEncoder rnn_{nullptr};
    };

    TORCH_MODULE(RecurrentBackbone);
}

#endif // HYDRA_MODEL_RECURRENT_HPP
