#ifndef HYDRA_RECURRENT_HPP
#define HYDRA_RECURRENT_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include <torch/torch.h>

#include "../../common/error.hpp"


namespace Hydra::Layer::Details {

    // Closed set of recurrent families; resolved once at construction.
    enum class RecurrentCell {
        GRU,
        LSTM,
    };

    // -------- Options --------
    struct RecurrentOptions {
        RecurrentCell cell{RecurrentCell::GRU};
        std::int64_t input_size{};
        std::int64_t hidden_size{};
        std::int64_t num_layers{1};
        double dropout{0.0};
        bool bias{true};
    };

    // GRU carries h, LSTM carries (h, c).
    using RecurrentState = std::variant<torch::Tensor, std::tuple<torch::Tensor, torch::Tensor>>;

    // -------- Internal detail helpers --------
    namespace Detail {
        inline torch::nn::GRUOptions to_torch_gru_options(const RecurrentOptions& o)
        {
            auto options = torch::nn::GRUOptions(o.input_size, o.hidden_size);
            options = options.num_layers(o.num_layers);
            options = options.dropout(o.dropout);
            options = options.batch_first(true);
            options = options.bias(o.bias);
            return options;
        }

        inline torch::nn::LSTMOptions to_torch_lstm_options(const RecurrentOptions& o) {
            torch::nn::LSTMOptions opt(o.input_size, o.hidden_size);
            opt = opt.num_layers(o.num_layers);
            opt = opt.dropout(o.dropout);
            opt = opt.batch_first(true);
            opt = opt.bias(o.bias);
            return opt;
        }
    } // namespace Detail

    inline RecurrentCell recurrent_cell_from_string(std::string name)
    {
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
            return static_cast<char>(std::toupper(ch));
        });
        if (name == "GRU") {
            return RecurrentCell::GRU;
        }
        if (name == "LSTM") {
            return RecurrentCell::LSTM;
        }
        throw ::Hydra::ConfigurationError("Only GRU and LSTM are supported (got '" + name + "').");
    }

    inline std::string to_string(RecurrentCell cell)
    {
        switch (cell) {
            case RecurrentCell::GRU: return "GRU";
            case RecurrentCell::LSTM: return "LSTM";
        }
        return "GRU";
    }

    // Batch-first GRU/LSTM encoder that returns the full output sequence together with the state needed to keep
    // feeding it one step at a time.
    class RecurrentEncoderImpl : public torch::nn::Module {
    public:
        explicit RecurrentEncoderImpl(const RecurrentOptions& options)
            : options_(options)
        {
            if (options_.input_size <= 0 || options_.hidden_size <= 0) {
                throw ::Hydra::ConfigurationError("Recurrent encoder requires positive input and hidden sizes.");
            }
            if (options_.num_layers <= 0) {
                throw ::Hydra::ConfigurationError("Recurrent encoder requires at least one layer.");
            }

            switch (options_.cell) {
                case RecurrentCell::GRU:
                    gru_ = register_module("gru", torch::nn::GRU(Detail::to_torch_gru_options(options_)));
                    break;
                case RecurrentCell::LSTM:
                    lstm_ = register_module("lstm", torch::nn::LSTM(Detail::to_torch_lstm_options(options_)));
                    break;
            }
        }

        // Starts from a zero state.
        std::pair<torch::Tensor, RecurrentState> forward(const torch::Tensor& input)
        {
            ensure_input_rank_(input);
            if (gru_) {
                auto [output, hidden] = gru_->forward(input);
                return {output, RecurrentState{hidden}};
            }
            auto [output, state] = lstm_->forward(input);
            return {output, RecurrentState{state}};
        }

        // Continues from `state`, typically with a single new time step.
        std::pair<torch::Tensor, RecurrentState> forward(const torch::Tensor& input, const RecurrentState& state)
        {
            ensure_input_rank_(input);
            if (gru_) {
                const auto* hidden = std::get_if<torch::Tensor>(&state);
                if (hidden == nullptr) {
                    throw std::invalid_argument("GRU encoder expects a single hidden-state tensor.");
                }
                auto [output, next] = gru_->forward(input, *hidden);
                return {output, RecurrentState{next}};
            }
            const auto* hidden = std::get_if<std::tuple<torch::Tensor, torch::Tensor>>(&state);
            if (hidden == nullptr) {
                throw std::invalid_argument("LSTM encoder expects an (h, c) state pair.");
            }
            auto [output, next] = lstm_->forward(input, *hidden);
            return {output, RecurrentState{next}};
        }

        [[nodiscard]] const RecurrentOptions& options() const noexcept { return options_; }

    private:
        void ensure_input_rank_(const torch::Tensor& x) const {
            if (x.dim() != 3) {
                throw ::Hydra::ShapeError("Recurrent encoder expects a 3D tensor [B,T,F], got "
                                            + ::Hydra::Common::format_shape(x) + ".");
            }
            if (x.size(2) != options_.input_size) {
                throw ::Hydra::ShapeError("Recurrent encoder expects " + std::to_string(options_.input_size)
                                            + " input features, got " + std::to_string(x.size(2)) + ".");
            }
        }

        RecurrentOptions options_{};
        torch::nn::GRU gru_{nullptr};
        torch::nn::LSTM lstm_{nullptr};
    };

    TORCH_MODULE(RecurrentEncoder);
}

#endif // HYDRA_RECURRENT_HPP
