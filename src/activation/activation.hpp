#ifndef HYDRA_ACTIVATION_HPP
#define HYDRA_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

namespace Hydra::Activation {
    enum class Type {
        Identity,
        ReLU,
        Sigmoid,
        Tanh,
        GeLU,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor GeLU{Type::GeLU};
}

#endif //HYDRA_ACTIVATION_HPP
