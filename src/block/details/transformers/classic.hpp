#ifndef HYDRA_CLASSIC_HPP
#define HYDRA_CLASSIC_HPP

// "Attention Is All You Need", Vaswani et al., NeurIPS 2017 (arXiv:1706.03762).
// Encoder half of the canonical transformer: multi-head self-attention and feed-forward sublayers, each wrapped in
// a residual connection with layer normalisation. Batch-first (B, T, E) in and out.

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../../activation/activation.hpp"
#include "../../../activation/apply.hpp"
#include "../../../common/error.hpp"
#include "../../../layer/layer.hpp"

namespace Hydra::Block::Details::Transformer::Classic {
    struct LayerNormOptions {
        double eps{1e-5};
        bool elementwise_affine{true};
    };

    struct EncoderOptions {
        std::size_t layers{2};
        std::int64_t embed_dim{512};
        std::int64_t num_heads{1};
        std::int64_t dim_feedforward{2048};
        double dropout{0.1};
        bool pre_norm{false};
        ::Hydra::Activation::Descriptor activation{::Hydra::Activation::ReLU};
        LayerNormOptions layer_norm{};
    };

    namespace Detail {
        inline void validate(const EncoderOptions& options)
        {
            if (options.embed_dim <= 0) {
                throw ::Hydra::ConfigurationError("Transformer encoder requires a positive embedding dimension.");
            }
            if (options.num_heads <= 0 || options.embed_dim % options.num_heads != 0) {
                throw ::Hydra::ConfigurationError("Transformer encoder embedding dimension "
                                                  + std::to_string(options.embed_dim)
                                                  + " must be divisible by the number of heads ("
                                                  + std::to_string(options.num_heads) + ").");
            }
            if (options.dim_feedforward <= 0) {
                throw ::Hydra::ConfigurationError("Transformer encoder requires a positive feed-forward width.");
            }
            if (options.layers == 0) {
                throw ::Hydra::ConfigurationError("Transformer encoder requires at least one layer.");
            }
        }

        class TransformerEncoderLayerImpl : public torch::nn::Module {
        public:
            explicit TransformerEncoderLayerImpl(const EncoderOptions& options)
                : options_(options)
            {
                auto norm_options = torch::nn::LayerNormOptions(std::vector<int64_t>{options_.embed_dim})
                                         .eps(options_.layer_norm.eps)
                                         .elementwise_affine(options_.layer_norm.elementwise_affine);
                norm1_ = register_module("norm1", torch::nn::LayerNorm(norm_options));
                norm2_ = register_module("norm2", torch::nn::LayerNorm(norm_options));

                auto attn_options = torch::nn::MultiheadAttentionOptions(options_.embed_dim, options_.num_heads);
                attn_options.dropout(options_.dropout);
                attention_ = register_module("self_attention", torch::nn::MultiheadAttention(attn_options));

                linear1_ = ::Hydra::Layer::Details::build_linear(
                    *this, ::Hydra::Layer::FC({options_.embed_dim, options_.dim_feedforward}), "linear1");
                linear2_ = ::Hydra::Layer::Details::build_linear(
                    *this, ::Hydra::Layer::FC({options_.dim_feedforward, options_.embed_dim}), "linear2");

                if (options_.dropout > 0.0) {
                    dropout_ = register_module("dropout",
                                               torch::nn::Dropout(torch::nn::DropoutOptions(options_.dropout)));
                }
            }

            torch::Tensor forward(torch::Tensor input)
            {
                auto residual = input;
                auto attn_input = options_.pre_norm ? norm1_->forward(input) : input;

                // MultiheadAttention is sequence-first.
                auto sequence_first = attn_input.transpose(0, 1);
                auto attention = std::get<0>(attention_->forward(sequence_first, sequence_first, sequence_first,
                                                                 /*key_padding_mask=*/{}, /*need_weights=*/false));
                attention = attention.transpose(0, 1);
                if (dropout_) {
                    attention = dropout_->forward(attention);
                }

                auto output = residual + attention;
                if (!options_.pre_norm) {
                    output = norm1_->forward(output);
                }

                residual = output;
                auto ff_input = options_.pre_norm ? norm2_->forward(output) : output;
                auto hidden = linear1_->forward(ff_input);
                hidden = ::Hydra::Activation::Details::apply(options_.activation.type, std::move(hidden));
                if (dropout_) {
                    hidden = dropout_->forward(hidden);
                }
                hidden = linear2_->forward(hidden);
                if (dropout_) {
                    hidden = dropout_->forward(hidden);
                }

                output = residual + hidden;
                if (!options_.pre_norm) {
                    output = norm2_->forward(output);
                }
                return output;
            }

        private:
            EncoderOptions options_{};
            torch::nn::LayerNorm norm1_{nullptr};
            torch::nn::LayerNorm norm2_{nullptr};
            torch::nn::MultiheadAttention attention_{nullptr};
            torch::nn::Linear linear1_{nullptr};
            torch::nn::Linear linear2_{nullptr};
            torch::nn::Dropout dropout_{nullptr};
        };

        TORCH_MODULE(TransformerEncoderLayer);
    }

    class TransformerEncoderImpl : public torch::nn::Module {
    public:
        explicit TransformerEncoderImpl(EncoderOptions options)
            : options_(std::move(options))
        {
            Detail::validate(options_);

            layers_.reserve(options_.layers);
            for (std::size_t index = 0; index < options_.layers; ++index) {
                layers_.push_back(register_module("layer_" + std::to_string(index),
                                                  Detail::TransformerEncoderLayer(options_)));
            }

            auto norm_options = torch::nn::LayerNormOptions(std::vector<int64_t>{options_.embed_dim})
                                     .eps(options_.layer_norm.eps)
                                     .elementwise_affine(options_.layer_norm.elementwise_affine);
            final_layer_norm_ = register_module("final_layer_norm", torch::nn::LayerNorm(norm_options));
        }

        torch::Tensor forward(torch::Tensor input)
        {
            if (input.dim() != 3 || input.size(2) != options_.embed_dim) {
                throw ::Hydra::ShapeError("Transformer encoder expects (batch, sequence, "
                                            + std::to_string(options_.embed_dim) + ") inputs, got "
                                            + ::Hydra::Common::format_shape(input) + ".");
            }
            auto output = std::move(input);
            for (auto& layer : layers_) {
                output = layer->forward(std::move(output));
            }
            return final_layer_norm_->forward(output);
        }

        [[nodiscard]] const EncoderOptions& options() const noexcept { return options_; }

    private:
        EncoderOptions options_{};
        std::vector<Detail::TransformerEncoderLayer> layers_{};
        torch::nn::LayerNorm final_layer_norm_{nullptr};
    };

    TORCH_MODULE(TransformerEncoder);
}

#endif //HYDRA_CLASSIC_HPP
