#ifndef HYDRA_MSE_HPP
#define HYDRA_MSE_HPP

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "reduction.hpp"

namespace Hydra::Loss::Details {

    namespace F = torch::nn::functional;

    struct MSEOptions {
        Reduction reduction{Reduction::Mean};
    };

    struct MSEDescriptor {
        MSEOptions options{};
    };

    inline torch::Tensor compute(const MSEDescriptor& descriptor,
                                 const torch::Tensor& prediction,
                                 const torch::Tensor& target)
    {
        if (prediction.sizes() != target.sizes()) {
            throw ::Hydra::ShapeError("MSE prediction " + ::Hydra::Common::format_shape(prediction)
                                      + " and target " + ::Hydra::Common::format_shape(target) + " differ.");
        }
        return F::mse_loss(
            prediction,
            target.to(prediction.device(), prediction.scalar_type()),
            F::MSELossFuncOptions().reduction(to_torch_reduction<F::MSELossFuncOptions>(descriptor.options.reduction))
        );
    }
}

#endif // HYDRA_MSE_HPP
