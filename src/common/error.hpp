#ifndef HYDRA_COMMON_ERROR_HPP
#define HYDRA_COMMON_ERROR_HPP

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Hydra {
    // Missing task size, value under its minimum, malformed configuration entry.
    class ConfigurationError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // A task was prepared before the task it is derived from.
    class OrderingError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    // A task entry point was reached before the matching prepare_to_* call.
    class ReadinessError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    // Input does not match (batch, n_in, space_dim), or a task produced an output of the wrong shape.
    class ShapeError : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Forecasting strategy unknown or not applicable to the backbone's forecast type.
    class StrategyError : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    namespace Common {
        inline std::string format_shape(const std::vector<std::int64_t>& shape)
        {
            std::ostringstream stream;
            stream << '(';
            for (std::size_t i = 0; i < shape.size(); ++i) {
                if (i > 0) {
                    stream << ", ";
                }
                stream << shape[i];
            }
            stream << ')';
            return stream.str();
        }

        inline std::string format_shape(const torch::Tensor& tensor)
        {
            if (!tensor.defined()) {
                return "(undefined)";
            }
            return format_shape(tensor.sizes().vec());
        }

        // Validates an integer hyperparameter against its lower bound.
        inline std::int64_t check_int_arg(std::int64_t value, std::int64_t minimum, const std::string& description)
        {
            if (value < minimum) {
                throw ConfigurationError("Integer " + description + " must be >= " + std::to_string(minimum)
                                         + " (got " + std::to_string(value) + ")");
            }
            return value;
        }
    }
}

#endif // HYDRA_COMMON_ERROR_HPP
