#ifndef HYDRA_BLOCK_DETAILS_NBEATS_HPP
#define HYDRA_BLOCK_DETAILS_NBEATS_HPP
// "N-BEATS: Neural basis expansion analysis for interpretable time series forecasting"
// Oreshkin et al., ICLR 2020 (arXiv:1905.10437). Generic (non-interpretable) basis.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../../activation/activation.hpp"
#include "../../../activation/apply.hpp"
#include "../../../common/error.hpp"
#include "../../../initialization/initialization.hpp"
#include "../../../layer/layer.hpp"

namespace Hydra::Block::Details::NBeats {
    struct BlockOptions {
        std::int64_t n_in{};
        std::int64_t n_layers{4};
        std::int64_t layer_width{256};
        std::int64_t expansion_coefficient_dim{5};
        std::optional<std::int64_t> n_out{};
        ::Hydra::Activation::Descriptor activation{::Hydra::Activation::ReLU};
        ::Hydra::Initialization::Descriptor initialization{::Hydra::Initialization::Default};
    };

    // Basis expansion coefficients, before the generators.
    struct Expansions {
        torch::Tensor backcast{};
        torch::Tensor forecast{};
    };

    struct BlockOutput {
        torch::Tensor backcast{};
        torch::Tensor forecast{};
    };

    class BlockImpl : public torch::nn::Module {
    public:
        explicit BlockImpl(BlockOptions options)
            : options_(std::move(options))
        {
            ::Hydra::Common::check_int_arg(options_.n_in, 1, "N-BEATS block input length");
            ::Hydra::Common::check_int_arg(options_.n_layers, 1, "N-BEATS block layer count");
            ::Hydra::Common::check_int_arg(options_.layer_width, 1, "N-BEATS block layer width");
            ::Hydra::Common::check_int_arg(options_.expansion_coefficient_dim, 1, "N-BEATS expansion coefficient dimension");

            fc_stack_.reserve(static_cast<std::size_t>(options_.n_layers));
            for (std::int64_t index = 0; index < options_.n_layers; ++index) {
                const auto in_features = index == 0 ? options_.n_in : options_.layer_width;
                fc_stack_.push_back(::Hydra::Layer::Details::build_linear(
                    *this,
                    ::Hydra::Layer::FC({in_features, options_.layer_width}, options_.activation, options_.initialization),
                    "fc_stack_" + std::to_string(index)));
            }

            backcast_expansion_ = ::Hydra::Layer::Details::build_linear(
                *this, ::Hydra::Layer::FC({options_.layer_width, options_.expansion_coefficient_dim}), "fc_backcast");
            forecast_expansion_ = ::Hydra::Layer::Details::build_linear(
                *this, ::Hydra::Layer::FC({options_.layer_width, options_.expansion_coefficient_dim}), "fc_forecast");
            g_backcast_ = ::Hydra::Layer::Details::build_linear(
                *this, ::Hydra::Layer::FC({options_.expansion_coefficient_dim, options_.n_in}), "g_backcast");

            if (options_.n_out.has_value()) {
                set_n_out(*options_.n_out);
            }
        }

        // Creates (or recreates) the forecast generator for a new horizon.
        void set_n_out(std::int64_t n_out)
        {
            ::Hydra::Common::check_int_arg(n_out, 1, "N-BEATS block output length");
            auto generator = ::Hydra::Layer::Details::make_linear(
                ::Hydra::Layer::FC({options_.expansion_coefficient_dim, n_out}));
            if (g_forecast_) {
                g_forecast_ = replace_module("g_forecast", generator);
            } else {
                g_forecast_ = register_module("g_forecast", generator);
            }
            options_.n_out = n_out;
        }

        Expansions expansions(torch::Tensor input)
        {
            auto hidden = std::move(input);
            for (auto& layer : fc_stack_) {
                hidden = ::Hydra::Activation::Details::apply(options_.activation.type, layer->forward(hidden));
            }
            return {backcast_expansion_->forward(hidden), forecast_expansion_->forward(hidden)};
        }

        BlockOutput from_expansions(const Expansions& expansions)
        {
            if (!g_forecast_) {
                throw ::Hydra::ReadinessError("N-BEATS block has no forecast generator; call set_n_out first.");
            }
            return {g_backcast_->forward(expansions.backcast), g_forecast_->forward(expansions.forecast)};
        }

        BlockOutput forward(torch::Tensor input)
        {
            return from_expansions(expansions(std::move(input)));
        }

        // The backcast path of the terminal block is never trained.
        void freeze_backcast_path()
        {
            backcast_expansion_->weight.set_requires_grad(false);
            g_backcast_->weight.set_requires_grad(false);
            if (backcast_expansion_->bias.defined()) {
                backcast_expansion_->bias.set_requires_grad(false);
            }
            if (g_backcast_->bias.defined()) {
                g_backcast_->bias.set_requires_grad(false);
            }
        }

        [[nodiscard]] const BlockOptions& options() const noexcept { return options_; }

        [[nodiscard]] const std::vector<torch::nn::Linear>& fc_stack() const noexcept { return fc_stack_; }
        [[nodiscard]] torch::nn::Linear backcast_expansion() const noexcept { return backcast_expansion_; }
        [[nodiscard]] torch::nn::Linear forecast_expansion() const noexcept { return forecast_expansion_; }
        [[nodiscard]] torch::nn::Linear g_backcast() const noexcept { return g_backcast_; }
        [[nodiscard]] torch::nn::Linear g_forecast() const noexcept { return g_forecast_; }

    private:
        BlockOptions options_{};
        std::vector<torch::nn::Linear> fc_stack_{};
        torch::nn::Linear backcast_expansion_{nullptr};
        torch::nn::Linear forecast_expansion_{nullptr};
        torch::nn::Linear g_backcast_{nullptr};
        torch::nn::Linear g_forecast_{nullptr};
    };

    TORCH_MODULE(Block);

    class StackImpl : public torch::nn::Module {
    public:
        StackImpl(std::int64_t n_blocks, const BlockOptions& block_options)
            : n_out_(block_options.n_out)
        {
            ::Hydra::Common::check_int_arg(n_blocks, 1, "number of blocks per N-BEATS stack");
            blocks_.reserve(static_cast<std::size_t>(n_blocks));
            for (std::int64_t index = 0; index < n_blocks; ++index) {
                blocks_.push_back(register_module("block_" + std::to_string(index), Block(block_options)));
            }
        }

        void set_n_out(std::int64_t n_out)
        {
            for (auto& block : blocks_) {
                block->set_n_out(n_out);
            }
            n_out_ = n_out;
        }

        // Returns (residual left for the next stack, summed forecast of this stack).
        std::pair<torch::Tensor, torch::Tensor> forward(torch::Tensor input)
        {
            if (!n_out_.has_value()) {
                throw ::Hydra::ReadinessError("N-BEATS stack has no output length; call set_n_out first.");
            }
            auto residual = std::move(input);
            auto forecast = torch::zeros({residual.size(0), *n_out_}, residual.options());
            for (auto& block : blocks_) {
                auto output = block->forward(residual);
                residual = residual - output.backcast;
                forecast = forecast + output.forecast;
            }
            return {residual, forecast};
        }

        [[nodiscard]] std::vector<Block>& blocks() noexcept { return blocks_; }
        [[nodiscard]] const std::vector<Block>& blocks() const noexcept { return blocks_; }

    private:
        std::optional<std::int64_t> n_out_{};
        std::vector<Block> blocks_{};
    };

    TORCH_MODULE(Stack);

    struct NetworkOptions {
        std::int64_t n_in{};
        std::int64_t n_stacks{1};
        std::int64_t n_blocks{1};
        std::int64_t n_layers{4};
        std::int64_t expansion_coefficient_dim{5};
        // One width per stack; a single entry is broadcast.
        std::vector<std::int64_t> layer_widths{256};
        std::optional<std::int64_t> n_out{};
        ::Hydra::Activation::Descriptor activation{::Hydra::Activation::ReLU};
        ::Hydra::Initialization::Descriptor initialization{::Hydra::Initialization::Default};
    };

    // Univariate doubly-residual network: stacks of blocks, each block removing its backcast from the residual
    // and adding its forecast to the running total.
    class NetworkImpl : public torch::nn::Module {
    public:
        explicit NetworkImpl(NetworkOptions options)
            : options_(std::move(options))
        {
            ::Hydra::Common::check_int_arg(options_.n_in, 1, "N-BEATS input length");
            ::Hydra::Common::check_int_arg(options_.n_stacks, 1, "number of N-BEATS stacks");
            ::Hydra::Common::check_int_arg(options_.n_blocks, 1, "number of N-BEATS blocks");

            if (options_.layer_widths.size() == 1 && options_.n_stacks > 1) {
                options_.layer_widths.assign(static_cast<std::size_t>(options_.n_stacks), options_.layer_widths.front());
            }
            if (options_.layer_widths.size() != static_cast<std::size_t>(options_.n_stacks)) {
                throw ::Hydra::ConfigurationError("N-BEATS needs one layer width per stack (got "
                                                  + std::to_string(options_.layer_widths.size()) + " for "
                                                  + std::to_string(options_.n_stacks) + " stacks).");
            }

            stacks_.reserve(static_cast<std::size_t>(options_.n_stacks));
            for (std::int64_t index = 0; index < options_.n_stacks; ++index) {
                BlockOptions block_options{};
                block_options.n_in = options_.n_in;
                block_options.n_layers = options_.n_layers;
                block_options.layer_width = options_.layer_widths[static_cast<std::size_t>(index)];
                block_options.expansion_coefficient_dim = options_.expansion_coefficient_dim;
                block_options.n_out = options_.n_out;
                block_options.activation = options_.activation;
                block_options.initialization = options_.initialization;
                stacks_.push_back(register_module("stack_" + std::to_string(index), Stack(options_.n_blocks, block_options)));
            }

            terminal_block()->freeze_backcast_path();
        }

        void set_n_out(std::int64_t n_out)
        {
            for (auto& stack : stacks_) {
                stack->set_n_out(n_out);
            }
            options_.n_out = n_out;
        }

        torch::Tensor forward(torch::Tensor input)
        {
            if (!options_.n_out.has_value()) {
                throw ::Hydra::ReadinessError("Did not give an `n_out` value to N-BEATS.");
            }
            check_input_(input);
            auto residual = std::move(input);
            auto forecast = torch::zeros({residual.size(0), *options_.n_out}, residual.options());
            for (auto& stack : stacks_) {
                auto [next_residual, stack_forecast] = stack->forward(residual);
                residual = std::move(next_residual);
                forecast = forecast + stack_forecast;
            }
            return forecast;
        }

        // Same residual pass as forward(), collecting every block's forecast expansion in stack-then-block order.
        // Does not need an output length.
        torch::Tensor featurize(torch::Tensor input)
        {
            check_input_(input);
            auto residual = std::move(input);
            std::vector<torch::Tensor> features;
            features.reserve(static_cast<std::size_t>(options_.n_stacks * options_.n_blocks));
            for (auto& stack : stacks_) {
                for (auto& block : stack->blocks()) {
                    auto expansions = block->expansions(residual);
                    residual = residual - block->g_backcast()->forward(expansions.backcast);
                    features.push_back(std::move(expansions.forecast));
                }
            }
            return torch::cat(features, /*dim=*/1);
        }

        // Individual block forecasts; their sum is forward().
        std::vector<torch::Tensor> block_forecasts(torch::Tensor input)
        {
            if (!options_.n_out.has_value()) {
                throw ::Hydra::ReadinessError("Did not give an `n_out` value to N-BEATS.");
            }
            check_input_(input);
            auto residual = std::move(input);
            std::vector<torch::Tensor> forecasts;
            for (auto& stack : stacks_) {
                for (auto& block : stack->blocks()) {
                    auto output = block->forward(residual);
                    residual = residual - output.backcast;
                    forecasts.push_back(std::move(output.forecast));
                }
            }
            return forecasts;
        }

        [[nodiscard]] std::int64_t feature_width() const noexcept
        {
            return options_.n_stacks * options_.n_blocks * options_.expansion_coefficient_dim;
        }

        [[nodiscard]] Block& terminal_block() { return stacks_.back()->blocks().back(); }

        [[nodiscard]] const std::vector<Stack>& stacks() const noexcept { return stacks_; }
        [[nodiscard]] const NetworkOptions& options() const noexcept { return options_; }
        [[nodiscard]] std::optional<std::int64_t> n_out() const noexcept { return options_.n_out; }

    private:
        void check_input_(const torch::Tensor& input) const
        {
            if (input.dim() != 2 || input.size(1) != options_.n_in) {
                throw ::Hydra::ShapeError("N-BEATS should take " + std::to_string(options_.n_in)
                                          + " time steps as input (got " + ::Hydra::Common::format_shape(input) + ").");
            }
        }

        NetworkOptions options_{};
        std::vector<Stack> stacks_{};
    };

    TORCH_MODULE(Network);
}

#endif // HYDRA_BLOCK_DETAILS_NBEATS_HPP
