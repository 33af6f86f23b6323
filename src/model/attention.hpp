#ifndef HYDRA_MODEL_ATTENTION_HPP
#define HYDRA_MODEL_ATTENTION_HPP

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
#include "backbone.hpp"

namespace Hydra::Model {
    struct AttentionBackboneOptions {
        BackboneOptions common{};
        std::int64_t n_layers{6};
        std::int64_t n_heads{1};
        std::int64_t dim_feedforward{2048};
        double dropout{0.1};
    };

    inline AttentionBackboneOptions attention_options_from_config(const Common::Config& config)
    {
        AttentionBackboneOptions options{};
        options.common = backbone_options_from_config(config);
        options.n_layers = config.get<std::int64_t>("n_layers", options.n_layers);
        options.n_heads = config.get<std::int64_t>("n_heads", options.n_heads);
        options.dim_feedforward = config.get<std::int64_t>("dim_feedforward", options.dim_feedforward);
        options.dropout = config.get<double>("dropout", options.dropout);
        options.common.extra = config.unconsumed();
        return options;
    }

    // Self-attention encoder over the raw channels (embedding width = space_dim).
    // Features are the time average of the encoded sequence.
    class AttentionBackboneImpl : public Backbone {
    public:
        explicit AttentionBackboneImpl(AttentionBackboneOptions options)
            : Backbone(options.common), options_(std::move(options))
        {
            Common::check_int_arg(options_.n_layers, 1, "number of encoder layers");
            Common::check_int_arg(options_.n_heads, 1, "number of attention heads");
            Common::check_int_arg(options_.dim_feedforward, 1, "feed-forward width");
            if (space_dim() % options_.n_heads != 0) {
                throw ConfigurationError("Number of attention heads (" + std::to_string(options_.n_heads)
                                         + ") must divide the space dimension (" + std::to_string(space_dim()) + ").");
            }
            if (options_.dropout < 0.0 || options_.dropout >= 1.0) {
                throw ConfigurationError("Attention dropout must lie in [0, 1) (got "
                                         + std::to_string(options_.dropout) + ").");
            }

            const auto& extra = backbone_options().extra;
            Block::EncoderOptions encoder_options{};
            encoder_options.layers = static_cast<std::size_t>(options_.n_layers);
            encoder_options.embed_dim = space_dim();
            encoder_options.num_heads = options_.n_heads;
            encoder_options.dim_feedforward = options_.dim_feedforward;
            encoder_options.dropout = options_.dropout;
            encoder_options.pre_norm = extra.get<bool>("norm_first", false);
            encoder_options.layer_norm.eps = extra.get<double>("layer_norm_eps", 1e-5);
            if (auto activation = extra.get_optional<std::string>("activation")) {
                encoder_options.activation = Activation::Details::from_string(*activation);
            }
            note_ignored_extra({"norm_first", "layer_norm_eps", "activation"});

            auto& hyperparameters = mutable_hyperparameters();
            hyperparameters.record("n_layers", options_.n_layers);
            hyperparameters.record("n_heads", options_.n_heads);
            hyperparameters.record("dim_feedforward", options_.dim_feedforward);
            hyperparameters.record("dropout", options_.dropout);
            hyperparameters.record_all(extra);

            encoder_ = register_module("encoder", Block::TransformerEncoder(encoder_options));

            prepare_requested_tasks({Task::Featurize, Task::Classify, Task::Forecast});
        }

        [[nodiscard]] std::string name() const override { return "Transformer"; }

        void prepare_to_classify(std::int64_t n_classes,
                                 std::optional<torch::nn::AnyModule> head = std::nullopt) override
        {
            mark_prepared(Task::Classify, n_classes);
            install_head(kClassifierHead, std::move(head), space_dim(), n_classes);
        }

        void prepare_to_featurize(std::int64_t n_features) override
        {
            if (n_features != space_dim()) {
                throw ConfigurationError("For this implementation of " + name()
                                         + ", the features of a sequence are the average of the encoded features,"
                                           " which have the space dimension (" + std::to_string(space_dim())
                                         + ", got " + std::to_string(n_features) + ").");
            }
            mark_prepared(Task::Featurize, n_features);
        }

        void prepare_to_forecast(std::int64_t n_out,
                                 std::optional<torch::nn::AnyModule> head = std::nullopt) override
        {
            mark_prepared(Task::Forecast, n_out);
            install_head(kForecasterHead, std::move(head), space_dim(), n_out * space_dim());
        }

        [[nodiscard]] std::vector<torch::Tensor> featurizer_parameters() override { return encoder_->parameters(); }

        [[nodiscard]] const AttentionBackboneOptions& options() const noexcept { return options_; }

    protected:
        torch::Tensor forward_classify(const torch::Tensor& input) override
        {
            return apply_head(kClassifierHead, forward_featurize(input));
        }

        torch::Tensor forward_featurize(const torch::Tensor& input) override
        {
            return encoder_->forward(input).mean(/*dim=*/1);
        }

        torch::Tensor forward_forecast(const torch::Tensor& input) override
        {
            return apply_head(kForecasterHead, forward_featurize(input))
                .reshape({input.size(0), *n_out(), space_dim()});
        }

    private:
        AttentionBackboneOptions options_{};
        Block::TransformerEncoder encoder_{nullptr};
    };

    TORCH_MODULE(AttentionBackbone);
}

#endif // HYDRA_MODEL_ATTENTION_HPP
