#ifndef LEXRULE_COMMON_HH
#define LEXRULE_COMMON_HH

#include <cstdint>
#include <string>
#include <string_view>

using namespace std::string_literals;
using namespace std::string_view_literals;

using u8    = std::uint8_t;
using u32   = std::uint32_t;
using usize = std::size_t;

/// Combine several lambdas into one for visiting std::variant
template<typename ...Lambdas>
struct Overloaded : Lambdas... { using Lambdas::operator()...; };

template<typename ...Lambdas>
Overloaded(Lambdas...) -> Overloaded<Lambdas...>;

#endif // LEXRULE_COMMON_HH
