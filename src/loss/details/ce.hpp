#ifndef HYDRA_CE_HPP
#define HYDRA_CE_HPP
#include <cstdint>
#include <string>
#include <torch/torch.h>
#include <vector>

#include "../../common/error.hpp"
#include "reduction.hpp"

namespace Hydra::Loss::Details {
    struct CrossEntropyOptions {
        Reduction reduction{Reduction::Mean};
        std::vector<double> weight{};
        double label_smoothing{0.0};
    };

    struct CrossEntropyDescriptor {
        CrossEntropyOptions options{};
    };

    // `prediction` holds logits (B, n_classes), `target` class indices (B).
    inline torch::Tensor compute(const CrossEntropyDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target) {
        if (!descriptor.options.weight.empty()
            && static_cast<std::int64_t>(descriptor.options.weight.size()) != prediction.size(1)) {
            throw ::Hydra::ConfigurationError("Cross-entropy class weights ("
                                              + std::to_string(descriptor.options.weight.size())
                                              + ") do not match the number of classes ("
                                              + std::to_string(prediction.size(1)) + ").");
        }
        auto opts = torch::nn::functional::CrossEntropyFuncOptions{};
        opts = opts.reduction(to_torch_reduction<torch::nn::functional::CrossEntropyFuncOptions>(descriptor.options.reduction));
        opts = opts.label_smoothing(descriptor.options.label_smoothing);
        if (!descriptor.options.weight.empty()) {
            auto weight_tensor = torch::tensor(
                descriptor.options.weight,
                torch::TensorOptions().dtype(prediction.scalar_type()).device(prediction.device()));
            opts = opts.weight(weight_tensor);
        }
        return torch::nn::functional::cross_entropy(prediction, target.to(prediction.device(), torch::kLong), opts);
    }
}
#endif //HYDRA_CE_HPP
