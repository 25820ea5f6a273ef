#pragma once

namespace turnloom::protocol {

    // Visitor built from a set of lambdas, for std::visit over the protocol variants.
    template <class... Ts>
    struct overloaded : Ts... { using Ts::operator()...; };
    template <class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

} // namespace turnloom::protocol
