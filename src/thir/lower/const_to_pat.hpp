#pragma once

#include "const/const.hpp"
#include "span/span.hpp"
#include "thir/pattern.hpp"
#include "type/type.hpp"

namespace thir {

// Turns a fully evaluated constant into the pattern that matches exactly it.
class ConstToPat {
public:
    virtual ~ConstToPat() = default;

    virtual PatPtr decompose(const const_eval::Const& value, span::Span span) = 0;
};

/**
 * @brief Decomposes valtrees by the constant's type.
 *
 * Scalars and `&str` stay Constant, tuples and structs become Leaf, enums
 * become Variant (the first leaf of the valtree is the variant index), arrays
 * and slices become Array and Slice, references and boxes become Deref.
 * Opaque and unevaluated constants are matched as a whole (Constant).
 * Throws std::logic_error when the valtree shape does not fit the type.
 */
class StructuralConstToPat : public ConstToPat {
public:
    explicit StructuralConstToPat(type::TypeContext& types) : types(types) {}

    PatPtr decompose(const const_eval::Const& value, span::Span span) override;

private:
    type::TypeContext& types;

    PatPtr recur(const const_eval::ValTree& tree, type::TypeId ty, span::Span span);
    std::vector<FieldPat> field_pats(const const_eval::ValTree::Branch& values, size_t first,
                                     const std::vector<type::TypeId>& field_types, span::Span span);
};

} // namespace thir
