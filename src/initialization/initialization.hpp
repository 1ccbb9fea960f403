#ifndef INSIGHT_INITIALIZATION_HPP
#define INSIGHT_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

namespace Insight::Initialization {
    enum class Type {
        Default,
        KaimingNormal,
    };

    struct Descriptor {
        Type type{Type::Default};
    };

    inline constexpr Descriptor Default{Type::Default};
    inline constexpr Descriptor KaimingNormal{Type::KaimingNormal};
}

#endif //INSIGHT_INITIALIZATION_HPP
