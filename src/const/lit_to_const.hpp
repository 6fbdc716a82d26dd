#pragma once

#include "const/oracle.hpp"
#include "type/type.hpp"

namespace const_eval {

// Converts a (possibly negated) literal to a valtree constant of `input.ty`.
// Integer literals are truncated to the type's width; overflow is diagnosed by
// the caller where it matters.
LitToConstResult lit_to_const(type::TypeContext& types, const LitToConstInput& input);

} // namespace const_eval
