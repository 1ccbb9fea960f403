#ifndef INSIGHT_ACTIVATION_HPP
#define INSIGHT_ACTIVATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

namespace Insight::Activation {
    enum class Type {
        Identity,
        ReLU,
        ELU,
        LeakyReLU,
        Sigmoid,
        Tanh,
        GeLU,
        SiLU,
    };

    struct Descriptor {
        Type type{Type::Identity};
    };

    inline constexpr Descriptor Identity{Type::Identity};
    inline constexpr Descriptor ReLU{Type::ReLU};
    inline constexpr Descriptor ELU{Type::ELU};
    inline constexpr Descriptor LeakyReLU{Type::LeakyReLU};
    inline constexpr Descriptor Sigmoid{Type::Sigmoid};
    inline constexpr Descriptor Tanh{Type::Tanh};
    inline constexpr Descriptor GeLU{Type::GeLU};
    inline constexpr Descriptor SiLU{Type::SiLU};
}

#endif //INSIGHT_ACTIVATION_HPP
