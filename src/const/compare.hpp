#pragma once

#include "const/const.hpp"
#include "const/oracle.hpp"
#include "type/type.hpp"

#include <compare>
#include <cstdint>
#include <optional>

namespace const_eval {

// Raw bits of a scalar constant, evaluating it through the oracle if needed.
// Throws std::logic_error if the constant is not a scalar or fails to evaluate.
uint64_t eval_bits(const Const& c, ConstEvalOracle& oracle);

// Total order on valtrees: leaves before branches, leaves by bits, branches
// lexicographically.
std::strong_ordering compare_valtrees(const ValTree& a, const ValTree& b);

/**
 * @brief Three-way comparison of two constants of the same type.
 *
 * Returns nullopt when the values are incomparable (a float NaN on either side).
 * Signed integers are compared after sign extension, floats as IEEE values,
 * everything else by unsigned bit pattern.
 */
std::optional<std::strong_ordering> compare_const_vals(const type::TypeContext& types,
                                                       const Const& a,
                                                       const Const& b,
                                                       ConstEvalOracle& oracle);

} // namespace const_eval
