// Number literal syntax: -? digit+ ('.' digit*)? ([eE] [+-]? digit+)?
#pragma once
#include <tao/pegtl.hpp>

namespace toon::grammar {
using namespace tao::pegtl;

struct sign : one<'-'> {};
struct integer_part : plus<digit> {};
struct fraction : seq<one<'.'>, star<digit>> {};
struct exponent : seq<one<'e', 'E'>, opt<one<'+', '-'>>, plus<digit>> {};
struct number : seq<opt<sign>, integer_part, opt<fraction>, opt<exponent>> {};

} // namespace toon::grammar
