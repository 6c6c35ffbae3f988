#ifndef UGP_COMMON_VISIT_HPP
#define UGP_COMMON_VISIT_HPP

namespace Ugp::Common {
    template <class... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };
    template <class... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;
}

#endif //UGP_COMMON_VISIT_HPP
