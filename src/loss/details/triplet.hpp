#ifndef HYDRA_TRIPLET_HPP
#define HYDRA_TRIPLET_HPP

#include <torch/torch.h>

#include "../../common/error.hpp"
#include "reduction.hpp"

namespace Hydra::Loss::Details {
    struct TripletMarginOptions {
        Reduction reduction{Reduction::Mean};
        double margin{1.0};
        double p{2.0};
        bool swap{false};
    };

    struct TripletMarginDescriptor {
        TripletMarginOptions options{};
    };

    // Pulls `anchor` toward `positive` and away from `negative` in feature space.
    inline torch::Tensor compute(const TripletMarginDescriptor& descriptor,
                                 const torch::Tensor& anchor,
                                 const torch::Tensor& positive,
                                 const torch::Tensor& negative)
    {
        if (anchor.sizes() != positive.sizes() || anchor.sizes() != negative.sizes()) {
            throw ::Hydra::ShapeError("Triplet features must share a shape, got "
                                      + ::Hydra::Common::format_shape(anchor) + ", "
                                      + ::Hydra::Common::format_shape(positive) + " and "
                                      + ::Hydra::Common::format_shape(negative) + ".");
        }
        using Options = torch::nn::functional::TripletMarginLossFuncOptions;
        auto opts = Options{}
                        .margin(descriptor.options.margin)
                        .p(descriptor.options.p)
                        .swap(descriptor.options.swap)
                        .reduction(to_torch_reduction<Options>(descriptor.options.reduction));
        return torch::nn::functional::triplet_margin_loss(anchor, positive, negative, opts);
    }
}

#endif // HYDRA_TRIPLET_HPP
