#include "const/compare.hpp"

#include "type/helper.hpp"
#include "utils/helpers.hpp"

#include <algorithm>
#include <bit>
#include <stdexcept>
#include <variant>

namespace const_eval {

namespace {

uint64_t leaf_bits(const ValTree& tree) {
    if (auto leaf = tree.as_leaf()) {
        return leaf->bits;
    }
    throw std::logic_error("eval_bits: expected a scalar, found an aggregate valtree");
}

template <typename Float>
std::optional<std::strong_ordering> partial_compare(Float a, Float b) {
    if (a < b) return std::strong_ordering::less;
    if (a > b) return std::strong_ordering::greater;
    if (a == b) return std::strong_ordering::equal;
    // NaN on at least one side.
    return std::nullopt;
}

} // namespace

uint64_t eval_bits(const Const& c, ConstEvalOracle& oracle) {
    return std::visit(Overloaded{
        [&](const TyConst& ty_const) -> uint64_t {
            return std::visit(Overloaded{
                [](const ValTree& tree) -> uint64_t { return leaf_bits(tree); },
                [&](const UnevaluatedConst& uneval) -> uint64_t {
                    auto structured = oracle.eval_unevaluated_for_typeck(uneval);
                    if (auto tree = std::get_if<std::optional<ValTree>>(&structured); tree && *tree) {
                        return leaf_bits(**tree);
                    }
                    auto value = oracle.eval_unevaluated(uneval);
                    if (auto val = std::get_if<ConstValue>(&value)) {
                        if (auto scalar = std::get_if<ScalarInt>(val)) {
                            return scalar->bits;
                        }
                    }
                    throw std::logic_error("eval_bits: expected bits of an evaluated constant");
                },
            }, ty_const.kind);
        },
        [](const ConstValue& value) -> uint64_t {
            if (auto scalar = std::get_if<ScalarInt>(&value)) {
                return scalar->bits;
            }
            throw std::logic_error("eval_bits: expected a scalar value");
        },
    }, c.value);
}

std::strong_ordering compare_valtrees(const ValTree& a, const ValTree& b) {
    const auto* a_leaf = a.as_leaf();
    const auto* b_leaf = b.as_leaf();
    if (a_leaf && b_leaf) {
        if (auto cmp = a_leaf->bits <=> b_leaf->bits; cmp != 0) {
            return cmp;
        }
        return a_leaf->size <=> b_leaf->size;
    }
    if (a_leaf) return std::strong_ordering::less;
    if (b_leaf) return std::strong_ordering::greater;

    const auto& a_children = *a.as_branch();
    const auto& b_children = *b.as_branch();
    const size_t common = std::min(a_children.size(), b_children.size());
    for (size_t i = 0; i < common; ++i) {
        if (auto cmp = compare_valtrees(a_children[i], b_children[i]); cmp != 0) {
            return cmp;
        }
    }
    return a_children.size() <=> b_children.size();
}

std::optional<std::strong_ordering> compare_const_vals(const type::TypeContext& types,
                                                       const Const& a,
                                                       const Const& b,
                                                       ConstEvalOracle& oracle) {
    if (a.ty != b.ty) {
        throw std::logic_error("compare_const_vals: constants of different types " +
                               types.to_string(a.ty) + " and " + types.to_string(b.ty));
    }
    const auto kind = type::helper::primitive_kind(types, a.ty);
    const bool needs_interpretation =
        kind && (type::helper::is_float(*kind) || type::helper::is_signed_int(*kind));

    // Hot path for ranges over chars and unsigned ints: raw comparison is
    // already value order.
    if (!needs_interpretation) {
        auto a_scalar = std::get_if<ConstValue>(&a.value);
        auto b_scalar = std::get_if<ConstValue>(&b.value);
        if (a_scalar && b_scalar) {
            auto a_int = std::get_if<ScalarInt>(a_scalar);
            auto b_int = std::get_if<ScalarInt>(b_scalar);
            if (a_int && b_int) {
                return a_int->bits <=> b_int->bits;
            }
        }
        auto a_tree = a.as_valtree();
        auto b_tree = b.as_valtree();
        if (a_tree && b_tree) {
            return compare_valtrees(*a_tree, *b_tree);
        }
    }

    const uint64_t a_bits = eval_bits(a, oracle);
    const uint64_t b_bits = eval_bits(b, oracle);

    if (kind == type::PrimitiveKind::F32) {
        return partial_compare(std::bit_cast<float>(static_cast<uint32_t>(a_bits)),
                               std::bit_cast<float>(static_cast<uint32_t>(b_bits)));
    }
    if (kind == type::PrimitiveKind::F64) {
        return partial_compare(std::bit_cast<double>(a_bits), std::bit_cast<double>(b_bits));
    }
    if (kind && type::helper::is_signed_int(*kind)) {
        const unsigned width = type::helper::bit_width(*kind);
        return type::helper::sign_extend(a_bits, width) <=> type::helper::sign_extend(b_bits, width);
    }
    return a_bits <=> b_bits;
}

} // namespace const_eval
