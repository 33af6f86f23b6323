#ifndef HYDRA_LOSS_HPP
#define HYDRA_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/reduction.hpp"
#include "details/ce.hpp"
#include "details/mse.hpp"
#include "details/triplet.hpp"

namespace Hydra::Loss {
    using Reduction = Details::Reduction;

    using CrossEntropyOptions = Details::CrossEntropyOptions;
    using MSEOptions = Details::MSEOptions;
    using TripletMarginOptions = Details::TripletMarginOptions;

    [[nodiscard]] inline auto MSE(const Details::MSEOptions& options = {}) -> Details::MSEDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto CrossEntropy(const Details::CrossEntropyOptions& options = {}) -> Details::CrossEntropyDescriptor {
        return {options};
    }

    [[nodiscard]] inline auto TripletMargin(const Details::TripletMarginOptions& options = {}) -> Details::TripletMarginDescriptor {
        return {options};
    }

    using Details::compute;
}

#endif //HYDRA_LOSS_HPP
