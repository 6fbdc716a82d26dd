#include "thir/lower/const_to_pat.hpp"

#include "type/helper.hpp"
#include "utils/debug_context.hpp"
#include "utils/helpers.hpp"

#include <stdexcept>
#include <string>

namespace thir {

namespace {

const const_eval::ValTree::Branch& expect_branch(const const_eval::ValTree& tree,
                                                 const type::TypeContext& types,
                                                 type::TypeId ty) {
    if (auto branch = tree.as_branch()) {
        return *branch;
    }
    throw std::logic_error(debug::format_with_context(
        "const_to_pat: scalar valtree for aggregate type " + types.to_string(ty)));
}

} // namespace

PatPtr StructuralConstToPat::decompose(const const_eval::Const& value, span::Span span) {
    if (auto tree = value.as_valtree()) {
        return recur(*tree, value.ty, span);
    }
    return make_pat(value.ty, span, Constant{value});
}

std::vector<FieldPat> StructuralConstToPat::field_pats(const const_eval::ValTree::Branch& values,
                                                       size_t first,
                                                       const std::vector<type::TypeId>& field_types,
                                                       span::Span span) {
    if (values.size() - first != field_types.size()) {
        throw std::logic_error(debug::format_with_context(
            "const_to_pat: valtree has " + std::to_string(values.size() - first) +
            " fields, type has " + std::to_string(field_types.size())));
    }
    std::vector<FieldPat> fields;
    fields.reserve(field_types.size());
    for (size_t i = 0; i < field_types.size(); ++i) {
        fields.push_back(FieldPat{i, recur(values[first + i], field_types[i], span)});
    }
    return fields;
}

PatPtr StructuralConstToPat::recur(const const_eval::ValTree& tree, type::TypeId ty, span::Span span) {
    // Copy: field_type and substitute may intern new types.
    const type::Type current = types.get_type(ty);
    return std::visit(Overloaded{
        [&](type::PrimitiveKind) -> PatPtr {
            return make_pat(ty, span, Constant{const_eval::Const::from_valtree(ty, tree)});
        },
        [&](const type::ReferenceType& ref) -> PatPtr {
            if (type::helper::primitive_kind(types, ref.referenced_type) == type::PrimitiveKind::STR) {
                return make_pat(ty, span, Constant{const_eval::Const::from_valtree(ty, tree)});
            }
            return make_pat(ty, span, Deref{recur(tree, ref.referenced_type, span)});
        },
        [&](const type::BoxType& boxed) -> PatPtr {
            return make_pat(ty, span, Deref{recur(tree, boxed.boxed_type, span)});
        },
        [&](const type::TupleType& tuple) -> PatPtr {
            const auto& values = expect_branch(tree, types, ty);
            return make_pat(ty, span, Leaf{field_pats(values, 0, tuple.elements, span)});
        },
        [&](const type::AdtType& adt_ty) -> PatPtr {
            const auto& adt = types.get_adt(adt_ty.id);
            const auto& values = expect_branch(tree, types, ty);
            size_t variant_index = 0;
            size_t first = 0;
            if (adt.is_enum()) {
                if (values.empty() || !values.front().is_leaf()) {
                    throw std::logic_error(debug::format_with_context(
                        "const_to_pat: enum valtree without variant index for " + adt.name));
                }
                variant_index = static_cast<size_t>(values.front().as_leaf()->bits);
                first = 1;
            }
            const size_t field_count = adt.variants.at(variant_index).fields.size();
            std::vector<type::TypeId> field_types;
            field_types.reserve(field_count);
            for (size_t i = 0; i < field_count; ++i) {
                field_types.push_back(types.field_type(adt_ty.id, variant_index, i, adt_ty.args));
            }
            auto fields = field_pats(values, first, field_types, span);
            if (adt.is_enum() && adt.variants.size() > 1) {
                return make_pat(ty, span, Variant{
                    .adt = adt_ty.id,
                    .args = adt_ty.args,
                    .variant_index = variant_index,
                    .subpatterns = std::move(fields),
                });
            }
            return make_pat(ty, span, Leaf{std::move(fields)});
        },
        [&](const type::ArrayType& array) -> PatPtr {
            const auto& values = expect_branch(tree, types, ty);
            if (values.size() != array.size) {
                throw std::logic_error(debug::format_with_context(
                    "const_to_pat: array valtree length mismatch for " + types.to_string(ty)));
            }
            std::vector<PatPtr> elements;
            elements.reserve(values.size());
            for (const auto& value : values) {
                elements.push_back(recur(value, array.element_type, span));
            }
            return make_pat(ty, span, Array{.prefix = std::move(elements), .slice = nullptr, .suffix = {}});
        },
        [&](const type::SliceType& slice) -> PatPtr {
            const auto& values = expect_branch(tree, types, ty);
            std::vector<PatPtr> elements;
            elements.reserve(values.size());
            for (const auto& value : values) {
                elements.push_back(recur(value, slice.element_type, span));
            }
            return make_pat(ty, span, Slice{.prefix = std::move(elements), .slice = nullptr, .suffix = {}});
        },
        [&](const auto&) -> PatPtr {
            throw std::logic_error(debug::format_with_context(
                "const_to_pat: cannot decompose a constant of type " + types.to_string(ty)));
        },
    }, current.value);
}

} // namespace thir
