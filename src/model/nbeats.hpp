#ifndef HYDRA_MODEL_NBEATS_HPP
#define HYDRA_MODEL_NBEATS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../activation/apply.hpp"
#include "../block/block.hpp"
#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../initialization/apply.hpp"
#include "backbone.hpp"

namespace Hydra::Model {
    struct NBeatsBackboneOptions {
        BackboneOptions common{};
        std::int64_t n_stacks{1};
        std::int64_t n_blocks{1};
        std::int64_t n_layers{4};
        std::int64_t expansion_coefficient_dim{5};
        // One entry per stack, or a single entry for all of them.
        std::vector<std::int64_t> layer_widths{256};
    };

    inline NBeatsBackboneOptions nbeats_options_from_config(const Common::Config& config)
    {
        NBeatsBackboneOptions options{};
        options.common = backbone_options_from_config(config);
        options.n_stacks = config.require<std::int64_t>("n_stacks");
        options.n_blocks = config.require<std::int64_t>("n_blocks");
        options.n_layers = config.get<std::int64_t>("n_layers", options.n_layers);
        options.expansion_coefficient_dim = config.require<std::int64_t>("expansion_coefficient_dim");
        Common::check_int_arg(options.n_stacks, 1, "number of N-BEATS stacks");
        options.layer_widths = config.get_list("layer_widths", static_cast<std::size_t>(options.n_stacks), 256);
        options.common.extra = config.unconsumed();
        return options;
    }

    // Channels are interleaved into one univariate sequence of length n_in * space_dim; forecasts are reshaped back
    // to (n_out, space_dim). Features are the forecast expansion coefficients of every block.
    class NBeatsBackboneImpl : public Backbone {
    public:
        explicit NBeatsBackboneImpl(NBeatsBackboneOptions options)
            : Backbone(options.common), options_(std::move(options))
        {
            const auto& extra = backbone_options().extra;
            Block::NBeatsOptions network_options{};
            network_options.n_in = n_in() * space_dim();
            network_options.n_stacks = options_.n_stacks;
            network_options.n_blocks = options_.n_blocks;
            network_options.n_layers = options_.n_layers;
            network_options.expansion_coefficient_dim = options_.expansion_coefficient_dim;
            network_options.layer_widths = options_.layer_widths;
            if (auto activation = extra.get_optional<std::string>("activation")) {
                network_options.activation = Activation::Details::from_string(*activation);
            }
            if (auto initialization = extra.get_optional<std::string>("initialization")) {
                network_options.initialization = Initialization::Details::from_string(*initialization);
            }
            note_ignored_extra({"activation", "initialization"});

            auto& hyperparameters = mutable_hyperparameters();
            hyperparameters.record("n_stacks", options_.n_stacks);
            hyperparameters.record("n_blocks", options_.n_blocks);
            hyperparameters.record("n_layers", options_.n_layers);
            hyperparameters.record("expansion_coefficient_dim", options_.expansion_coefficient_dim);
            hyperparameters.record_all(extra);

            nbeats_ = register_module("nbeats", Block::NBeatsNetwork(network_options));

            prepare_requested_tasks({Task::Forecast, Task::Featurize, Task::Classify});
        }

        [[nodiscard]] std::string name() const override { return "N-BEATS"; }

        void prepare_to_classify(std::int64_t n_classes,
                                 std::optional<torch::nn::AnyModule> head = std::nullopt) override
        {
            if (!is_prepared_to_featurize()) {
                throw OrderingError("Prepare " + name() + " to featurize before preparing to classify.");
            }
            mark_prepared(Task::Classify, n_classes);
            install_head(kClassifierHead, std::move(head), *n_features(), n_classes);
        }

        void prepare_to_featurize(std::int64_t n_features) override
        {
            if (n_features != nbeats_->feature_width()) {
                throw ConfigurationError("This implementation of " + name()
                                         + " uses the expansion coefficients as features: n_features must be "
                                         + std::to_string(nbeats_->feature_width()) + " (got "
                                         + std::to_string(n_features) + ").");
            }
            mark_prepared(Task::Featurize, n_features);
        }

        // The network is its own forecaster; a caller-supplied head is not used.
        void prepare_to_forecast(std::int64_t n_out,
                                 std::optional<torch::nn::AnyModule> head = std::nullopt) override
        {
            if (head) {
                Utils::Log::warning(name() + " forecasts with its own generators; the supplied head is ignored.");
            }
            mark_prepared(Task::Forecast, n_out);
            nbeats_->set_n_out(n_out * space_dim());
        }

        // Each block's contribution to forward(x, Task::Forecast), as (batch, n_out, space_dim) tensors.
        std::vector<torch::Tensor> block_forecasts(const torch::Tensor& input)
        {
            check_input(input);
            if (!is_prepared_to_forecast()) {
                throw ReadinessError(name() + " was not prepared to forecast.");
            }
            auto forecasts = nbeats_->block_forecasts(flatten_(input));
            for (auto& forecast : forecasts) {
                forecast = forecast.reshape({input.size(0), -1, space_dim()});
            }
            return forecasts;
        }

        // Every block's trunk, expansion heads and backcast generator, minus the frozen terminal backcast path.
        // Forecast generators stay trainable.
        [[nodiscard]] std::vector<torch::Tensor> featurizer_parameters() override
        {
            std::vector<torch::Tensor> parameters;
            auto terminal = nbeats_->terminal_block();
            for (const auto& stack : nbeats_->stacks()) {
                for (const auto& block : stack->blocks()) {
                    auto append = [&parameters](const torch::nn::Linear& layer) {
                        for (const auto& parameter : layer->parameters()) {
                            parameters.push_back(parameter);
                        }
                    };
                    for (const auto& layer : block->fc_stack()) {
                        append(layer);
                    }
                    append(block->forecast_expansion());
                    if (block.get() != terminal.get()) {
                        append(block->backcast_expansion());
                        append(block->g_backcast());
                    }
                }
            }
            return parameters;
        }

        [[nodiscard]] Block::NBeatsNetwork& network() noexcept { return nbeats_; }
        [[nodiscard]] const NBeatsBackboneOptions& options() const noexcept { return options_; }

    protected:
        torch::Tensor forward_classify(const torch::Tensor& input) override
        {
            return apply_head(kClassifierHead, forward_featurize(input));
        }

        torch::Tensor forward_featurize(const torch::Tensor& input) override
        {
            return nbeats_->featurize(flatten_(input));
        }

        torch::Tensor forward_forecast(const torch::Tensor& input) override
        {
            return nbeats_->forward(flatten_(input)).reshape({input.size(0), -1, space_dim()});
        }

    private:
        [[nodiscard]] torch::Tensor flatten_(const torch::Tensor& input) const
        {
            return input.reshape({input.size(0), -1});
        }

        NBeatsBackboneOptions options_{};
        Block::NBeatsNetwork nbeats_{nullptr};
    };

    TORCH_MODULE(NBeatsBackbone);
}

#endif // HYDRA_MODEL_NBEATS_HPP
