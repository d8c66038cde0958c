#pragma once

namespace cqlgen {

// Helper for std::visit with multiple lambdas
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace cqlgen
