#ifndef HYDRA_FORECAST_HORIZON_HPP
#define HYDRA_FORECAST_HORIZON_HPP
/*
 * Horizon extension
 * ---------------------------------------------------------------------------
 *  Extend a forecaster with a fixed output length to any horizon n >= 1.
 *  Every routine returns (batch, n_in + n, space_dim) and leaves the first
 *  n_in steps equal to the input.
 *
 *   forecast_in_chunks       : slide an n_in window over what has been
 *                              produced so far, call the primitive, keep
 *                              min(n_out, remaining) steps, advance by n_out.
 *   recurrent_autoregression : keep the recurrent state, project the last
 *                              hidden output to the next step and feed only
 *                              that step back in.
 */

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../layer/layer.hpp"

namespace Hydra::Forecast {
    namespace Detail {
        inline void check_horizon(std::int64_t n)
        {
            if (n < 1) {
                throw ::Hydra::ConfigurationError("Forecast horizon must be >= 1 (got " + std::to_string(n) + ").");
            }
        }

        inline void check_window(const torch::Tensor& input, std::int64_t n_in)
        {
            if (input.dim() != 3 || input.size(1) != n_in) {
                throw ::Hydra::ShapeError("Horizon extension expects (batch, " + std::to_string(n_in)
                                          + ", space_dim) inputs, got " + ::Hydra::Common::format_shape(input) + ".");
            }
        }

        inline torch::Tensor make_buffer(const torch::Tensor& input, std::int64_t n)
        {
            auto buffer = torch::empty({input.size(0), input.size(1) + n, input.size(2)}, input.options());
            buffer.narrow(1, 0, input.size(1)).copy_(input);
            return buffer;
        }
    }

    // `primitive(window)` maps (B, n_in, D) to (B, n_out, D).
    template <class Primitive>
    torch::Tensor forecast_in_chunks(const torch::Tensor& input,
                                     std::int64_t n,
                                     std::int64_t n_in,
                                     std::int64_t n_out,
                                     Primitive&& primitive)
    {
        Detail::check_horizon(n);
        Detail::check_window(input, n_in);
        ::Hydra::Common::check_int_arg(n_out, 1, "forecast chunk length");

        auto output = Detail::make_buffer(input, n);
        const auto total = n_in + n;
        for (std::int64_t step = n_in; step < total; step += n_out) {
            auto window = output.narrow(1, step - n_in, n_in).clone();
            torch::Tensor chunk = primitive(window);
            if (chunk.dim() != 3 || chunk.size(0) != input.size(0) || chunk.size(1) != n_out
                || chunk.size(2) != input.size(2)) {
                throw ::Hydra::ShapeError("Forecast primitive returned " + ::Hydra::Common::format_shape(chunk)
                                          + ", expected (" + std::to_string(input.size(0)) + ", "
                                          + std::to_string(n_out) + ", " + std::to_string(input.size(2)) + ").");
            }
            const auto kept = std::min(n_out, total - step);
            output.narrow(1, step, kept).copy_(chunk.narrow(1, 0, kept));
        }
        return output;
    }

    // `project(hidden)` maps the last hidden output (B, H) to the next step (B, D).
    template <class Projection>
    torch::Tensor recurrent_autoregression(const torch::Tensor& input,
                                           std::int64_t n,
                                           ::Hydra::Layer::RecurrentEncoder& encoder,
                                           Projection&& project)
    {
        Detail::check_horizon(n);
        if (input.dim() != 3) {
            throw ::Hydra::ShapeError("Recurrent autoregression expects (batch, n_in, space_dim) inputs, got "
                                      + ::Hydra::Common::format_shape(input) + ".");
        }

        const auto n_in = input.size(1);
        auto output = Detail::make_buffer(input, n);
        auto [hidden, state] = encoder->forward(input);
        for (std::int64_t step = n_in; step < n_in + n; ++step) {
            torch::Tensor next = project(hidden.select(1, -1));
            output.select(1, step).copy_(next);
            auto advanced = encoder->forward(next.unsqueeze(1), state);
            hidden = std::move(advanced.first);
            state = std::move(advanced.second);
        }
        return output;
    }
}

#endif // HYDRA_FORECAST_HORIZON_HPP
