#include "thir/lower/lower_internal.hpp"

#include "thir/pretty_print.hpp"
#include "type/helper.hpp"
#include "utils/debug_context.hpp"
#include "utils/helpers.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace thir {

namespace detail {

PatPtr PatternLowerer::lower_pattern(const hir::Pattern& pat) {
    auto guard = debug::push("pattern", "hir#" + std::to_string(pat.hir_id));

    PatPtr result = lower_pattern_unadjusted(pat);

    const auto* adjustments = ctx.typeck.pat_adjustments(pat.hir_id);
    if (!adjustments) {
        return result;
    }
    // Adjustments are recorded outermost first; wrap from the innermost out.
    // Each wrapper takes the span of the node it wraps.
    for (auto it = adjustments->rbegin(); it != adjustments->rend(); ++it) {
        trace("implicit deref of " + ctx.types.to_string(*it));
        const span::Span inner_span = result->span;
        result = make_pat(*it, inner_span, Deref{std::move(result)});
    }
    return result;
}

PatPtr PatternLowerer::lower_pattern_unadjusted(const hir::Pattern& pat) {
    const TypeId ty = ctx.typeck.node_type(pat.hir_id);

    auto kind = std::visit(Overloaded{
        [&](const hir::WildcardPattern&) -> std::optional<PatKind> { return PatKind{Wild{}}; },
        [&](const hir::LiteralPattern& lit) -> std::optional<PatKind> {
            if (!lit.expr) {
                throw std::logic_error(debug::format_with_context("literal pattern without expression"));
            }
            return lower_lit(*lit.expr);
        },
        [&](const hir::RangePattern& range) -> std::optional<PatKind> {
            if (!range.lo && !range.hi) {
                return PatKind{Error{error(ErrorKind::UnboundedRange,
                                           "range pattern needs at least one bound", pat.span)}};
            }
            auto result = lower_pattern_range(range.lo.get(), range.hi.get(), range.end, ty, pat.span);
            if (auto id = std::get_if<DiagnosticId>(&result)) {
                return PatKind{Error{*id}};
            }
            return std::move(std::get<PatKind>(result));
        },
        [&](const hir::PathPattern&) -> std::optional<PatKind> { return std::nullopt; },
        [&](const hir::BindingPattern&) -> std::optional<PatKind> { return std::nullopt; },
        [&](const hir::ReferencePattern& ref) -> std::optional<PatKind> {
            return PatKind{Deref{lower_pattern(*ref.subpattern)}};
        },
        [&](const hir::BoxPattern& boxed) -> std::optional<PatKind> {
            return PatKind{Deref{lower_pattern(*boxed.subpattern)}};
        },
        [&](const hir::SlicePattern& slice) -> std::optional<PatKind> {
            return slice_or_array_pattern(ty, slice);
        },
        [&](const hir::TuplePattern& tuple) -> std::optional<PatKind> {
            const auto* tuple_ty = type::helper::as_tuple(ctx.types, ty);
            if (!tuple_ty) {
                throw std::logic_error(debug::format_with_context(
                    "tuple pattern matched against non-tuple type " + ctx.types.to_string(ty)));
            }
            const size_t arity = tuple_ty->elements.size();
            return PatKind{Leaf{lower_tuple_subpats(tuple.elements, arity, tuple.dotdot_pos)}};
        },
        [&](const hir::TupleStructPattern& tuple_struct) -> std::optional<PatKind> {
            if (auto error_ty = std::get_if<type::ErrorType>(&ctx.types.get_type(ty).value)) {
                return PatKind{Error{error_ty->reported}};
            }
            const auto* adt_ty = type::helper::as_adt(ctx.types, ty);
            if (!adt_ty) {
                throw std::logic_error(debug::format_with_context(
                    "tuple struct pattern not applied to an ADT: " + ctx.types.to_string(ty)));
            }
            const type::AdtId adt = adt_ty->id;
            const hir::Res res = ctx.typeck.qpath_res(pat.hir_id);
            const size_t field_count = variant_of_res(adt, res).fields.size();
            auto subpatterns = lower_tuple_subpats(tuple_struct.elements, field_count, tuple_struct.dotdot_pos);
            return lower_variant_or_leaf(res, pat.hir_id, pat.span, ty, std::move(subpatterns));
        },
        [&](const hir::StructPattern& strukt) -> std::optional<PatKind> {
            const hir::Res res = ctx.typeck.qpath_res(pat.hir_id);
            std::vector<FieldPat> subpatterns;
            subpatterns.reserve(strukt.fields.size());
            for (const auto& field : strukt.fields) {
                subpatterns.push_back(FieldPat{
                    .field = ctx.typeck.field_index(field.hir_id),
                    .pattern = lower_pattern(*field.pattern),
                });
            }
            return lower_variant_or_leaf(res, pat.hir_id, pat.span, ty, std::move(subpatterns));
        },
        [&](const hir::OrPattern& alternatives) -> std::optional<PatKind> {
            return PatKind{Or{lower_patterns(alternatives.alternatives)}};
        },
    }, pat.value);

    if (kind) {
        return make_pat(ty, pat.span, std::move(*kind));
    }
    // Paths and bindings build their own node.
    if (auto path = std::get_if<hir::PathPattern>(&pat.value)) {
        return lower_path(path->path, pat.hir_id, pat.span);
    }
    return lower_binding(pat, std::get<hir::BindingPattern>(pat.value), ty);
}

PatPtr PatternLowerer::lower_binding(const hir::Pattern& pat, const hir::BindingPattern& binding, TypeId ty) {
    const auto recorded = ctx.typeck.binding_mode(pat.hir_id);
    if (!recorded) {
        throw std::logic_error(debug::format_with_context(
            "missing binding mode for '" + binding.ident.name + "'"));
    }

    // `x @ sub` reports the binding at `x` only.
    span::Span span = pat.span;
    if (auto ident_span = binding.ident.span.find_ancestor_inside(pat.span)) {
        span = pat.span.with_end(ident_span->end);
    }

    hir::Mutability mutability = recorded->mutability;
    BindingMode mode = BindingMode::by_value();
    const TypeId var_ty = ty;
    TypeId node_ty = ty;
    if (recorded->by_ref) {
        // A `ref` binding is itself immutable; the mutability is the borrow's.
        mutability = hir::Mutability::Not;
        mode = BindingMode::by_ref(recorded->mutability == hir::Mutability::Mut ? BorrowKind::Mut
                                                                               : BorrowKind::Shared);
        const auto* ref = type::helper::as_reference(ctx.types, ty);
        if (!ref) {
            throw std::logic_error(debug::format_with_context(
                "`ref` binding '" + binding.ident.name + "' has non-reference type " + ctx.types.to_string(ty)));
        }
        node_ty = ref->referenced_type;
    }

    return make_pat(node_ty, span, Binding{
        .mutability = mutability,
        .name = binding.ident.name,
        .mode = mode,
        .var = LocalVarId{binding.var_id},
        .ty = var_ty,
        .subpattern = lower_opt_pattern(binding.subpattern),
        .is_primary = binding.var_id == pat.hir_id,
    });
}

PatPtr PatternLowerer::lower_opt_pattern(const hir::PatternPtr& pat) {
    return pat ? lower_pattern(*pat) : nullptr;
}

std::vector<PatPtr> PatternLowerer::lower_patterns(const std::vector<hir::PatternPtr>& pats) {
    std::vector<PatPtr> lowered;
    lowered.reserve(pats.size());
    for (const auto& pat : pats) {
        lowered.push_back(lower_pattern(*pat));
    }
    return lowered;
}

std::vector<FieldPat> PatternLowerer::lower_tuple_subpats(const std::vector<hir::PatternPtr>& pats,
                                                          size_t expected_len,
                                                          std::optional<size_t> gap_pos) {
    const auto indices = utils::enumerate_and_adjust(pats.size(), expected_len, gap_pos);
    std::vector<FieldPat> fields;
    fields.reserve(pats.size());
    for (size_t i = 0; i < pats.size(); ++i) {
        fields.push_back(FieldPat{.field = indices[i], .pattern = lower_pattern(*pats[i])});
    }
    return fields;
}

PatKind PatternLowerer::slice_or_array_pattern(TypeId ty, const hir::SlicePattern& slice) {
    const type::Type scrutinee = ctx.types.get_type(ty);
    if (std::holds_alternative<type::SliceType>(scrutinee.value)) {
        return Slice{
            .prefix = lower_patterns(slice.prefix),
            .slice = lower_opt_pattern(slice.slice),
            .suffix = lower_patterns(slice.suffix),
        };
    }
    if (auto array = std::get_if<type::ArrayType>(&scrutinee.value)) {
        if (array->size < slice.prefix.size() + slice.suffix.size()) {
            throw std::logic_error(debug::format_with_context(
                "array pattern with " + std::to_string(slice.prefix.size() + slice.suffix.size()) +
                " elements matched against " + ctx.types.to_string(ty)));
        }
        return Array{
            .prefix = lower_patterns(slice.prefix),
            .slice = lower_opt_pattern(slice.slice),
            .suffix = lower_patterns(slice.suffix),
        };
    }
    throw std::logic_error(debug::format_with_context(
        "slice pattern matched against " + ctx.types.to_string(ty)));
}

DiagnosticId PatternLowerer::error(ErrorKind kind, std::string message, span::Span span,
                                   std::vector<std::string> notes) {
    trace(std::string(::to_string(kind)) + ": " + message);
    return ctx.diagnostics.emit(Diagnostic{
        .kind = kind,
        .message = std::move(message),
        .span = span,
        .notes = std::move(notes),
    });
}

void PatternLowerer::trace(const std::string& message) const {
    if (ctx.options.trace) {
        debug::trace("PAT", message);
    }
}

} // namespace detail

PatPtr pat_from_hir(LoweringContext& ctx, const hir::Pattern& pattern) {
    detail::PatternLowerer lowerer(ctx);
    auto pat = lowerer.lower_pattern(pattern);
    if (ctx.options.trace) {
        debug::trace("PAT", "lowered hir#" + std::to_string(pattern.hir_id) + " to " + to_string(ctx.types, *pat));
    }
    return pat;
}

std::vector<PatPtr> pats_from_hir(LoweringContext& ctx, const std::vector<hir::PatternPtr>& patterns) {
    std::vector<PatPtr> lowered;
    lowered.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        lowered.push_back(pat_from_hir(ctx, *pattern));
    }
    return lowered;
}

RangeResult lower_range(LoweringContext& ctx, const hir::Expr* lo, const hir::Expr* hi,
                        hir::RangeEnd end, type::TypeId ty, span::Span span) {
    detail::PatternLowerer lowerer(ctx);
    return lowerer.lower_pattern_range(lo, hi, end, ty, span);
}

} // namespace thir
