#include "thir/lower/lower_internal.hpp"

#include "thir/pretty_print.hpp"
#include "utils/debug_context.hpp"
#include "utils/helpers.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace thir::detail {

namespace {

struct LiteralOperand {
    const hir::Literal* lit = nullptr;
    bool negated = false;
};

// `5` or `-5`. The minus is folded into the conversion so that `-128i8`
// never materializes `128i8`.
std::optional<LiteralOperand> as_literal_operand(const hir::Expr& expr) {
    if (auto lit = std::get_if<hir::LiteralExpr>(&expr.value)) {
        return LiteralOperand{&lit->literal, false};
    }
    if (auto negate = std::get_if<hir::NegateExpr>(&expr.value)) {
        if (negate->operand) {
            if (auto lit = std::get_if<hir::LiteralExpr>(&negate->operand->value)) {
                return LiteralOperand{&lit->literal, true};
            }
        }
    }
    return std::nullopt;
}

} // namespace

PatPtr PatternLowerer::const_to_pat(const const_eval::Const& value, span::Span span) {
    return ctx.const_to_pat.decompose(value, span);
}

PatKind PatternLowerer::lower_lit(const hir::Expr& expr) {
    if (auto path = std::get_if<hir::PathExpr>(&expr.value)) {
        return std::move(lower_path(path->path, expr.hir_id, expr.span)->kind);
    }
    if (auto block = std::get_if<hir::ConstBlockExpr>(&expr.value)) {
        return lower_inline_const(block->block, expr.hir_id, expr.span);
    }

    const auto operand = as_literal_operand(expr);
    if (!operand) {
        throw std::logic_error(debug::format_with_context("negation of a non-literal in a pattern"));
    }

    const TypeId ty = ctx.typeck.expr_ty(expr);
    auto converted = ctx.oracle.lit_to_const(const_eval::LitToConstInput{
        .lit = operand->lit,
        .ty = ty,
        .negated = operand->negated,
    });
    return std::visit(Overloaded{
        [&](const const_eval::Const& value) -> PatKind {
            return std::move(const_to_pat(value, operand->lit->span)->kind);
        },
        [&](const const_eval::LitToConstError& failure) -> PatKind {
            if (failure.kind == const_eval::LitToConstError::Kind::TypeError) {
                throw std::logic_error(debug::format_with_context(
                    "literal does not fit pattern type " + ctx.types.to_string(ty)));
            }
            trace("literal conversion failed: " + failure.diagnostic.message);
            return Error{ctx.diagnostics.emit(failure.diagnostic)};
        },
    }, converted);
}

PatPtr PatternLowerer::lower_path(const hir::QPath& qpath, hir::HirId id, span::Span span) {
    const TypeId ty = ctx.typeck.node_type(id);
    const hir::Res res = ctx.typeck.qpath_res(id);

    const bool is_associated_const = res.is_def(type::DefKind::AssocConst);
    if (!res.is_def(type::DefKind::Const) && !is_associated_const) {
        return make_pat(ty, span, lower_variant_or_leaf(res, id, span, ty, {}));
    }

    const std::string name = qpath.segments.empty() ? ctx.types.def(res.def_id).name
                                                    : qpath.segments.back().name;
    const type::GenericArgs args = ctx.typeck.node_args(id);

    const auto resolution = ctx.oracle.resolve_instance(res.def_id, args);
    switch (resolution.status) {
        case const_eval::InstanceResolution::Status::Resolved:
            break;
        case const_eval::InstanceResolution::Status::NoInstance:
            if (!is_associated_const) {
                throw std::logic_error(debug::format_with_context(
                    "free constant '" + name + "' has no instance"));
            }
            return make_pat(ty, span, Error{error(
                ErrorKind::AssociatedConstantUnresolved,
                "associated consts cannot be referenced in patterns without a concrete implementation",
                span, {"`" + name + "` could not be resolved to an impl"})});
        case const_eval::InstanceResolution::Status::Failed:
            return make_pat(ty, span, Error{error(
                ErrorKind::ConstantEvaluationFailed, "could not evaluate constant pattern", span)});
    }

    // Prefer the valtree so that the pattern can be decomposed structurally.
    std::optional<const_eval::Const> value;
    std::optional<const_eval::EvalError> failure;
    auto structured = ctx.oracle.eval_global_for_typeck(resolution.instance);
    if (auto tree = std::get_if<std::optional<const_eval::ValTree>>(&structured)) {
        if (*tree) {
            value = const_eval::Const::from_valtree(ty, **tree);
        } else {
            auto opaque = ctx.oracle.eval_global(resolution.instance);
            if (auto val = std::get_if<const_eval::ConstValue>(&opaque)) {
                value = const_eval::Const::from_value(ty, *val);
            } else {
                failure = std::get<const_eval::EvalError>(opaque);
            }
        }
    } else {
        failure = std::get<const_eval::EvalError>(structured);
    }

    if (failure) {
        if (failure->kind == const_eval::EvalError::Kind::TooGeneric) {
            trace("constant '" + name + "' is too generic");
            return make_pat(ty, span, Error{error(
                ErrorKind::ConstantEvaluationTooGeneric,
                "constant pattern depends on a generic parameter", span,
                {"`" + name + "` cannot be evaluated until the generic parameters are known"})});
        }
        std::vector<std::string> notes;
        if (!failure->diagnostic.message.empty()) {
            notes.push_back(failure->diagnostic.message);
        }
        return make_pat(ty, span, Error{error(
            ErrorKind::ConstantEvaluationFailed, "could not evaluate constant pattern", span, std::move(notes))});
    }

    trace("constant '" + name + "' = " + to_string(ctx.types, *value));
    PatPtr pattern = const_to_pat(*value, span);

    if (!is_associated_const) {
        return pattern;
    }
    if (const auto* user_ty = ctx.typeck.user_provided_type(id)) {
        Ascription ascription{
            .annotation = CanonicalUserTypeAnnotation{
                .user_ty = *user_ty,
                .span = span,
                .inferred_ty = value->ty,
            },
            .variance = Variance::Contravariant,
        };
        return make_pat(value->ty, span, AscribeUserType{
            .ascription = std::move(ascription),
            .subpattern = std::move(pattern),
        });
    }
    return pattern;
}

PatKind PatternLowerer::lower_inline_const(const hir::ConstBlock& block, hir::HirId id, span::Span span) {
    const TypeId ty = ctx.typeck.node_type(id);

    if (ctx.options.inline_const_literal_fast_path && block.body) {
        if (auto operand = as_literal_operand(*block.body)) {
            auto converted = ctx.oracle.lit_to_const(const_eval::LitToConstInput{
                .lit = operand->lit,
                .ty = ty,
                .negated = operand->negated,
            });
            if (auto value = std::get_if<const_eval::Const>(&converted)) {
                return std::move(const_to_pat(*value, span)->kind);
            }
            // Fall through; the full evaluation reports the problem.
        }
    }

    const const_eval::UnevaluatedConst uneval{
        .def = block.def_id,
        .args = ctx.typeck.node_args(block.hir_id),
    };

    auto structured = ctx.oracle.eval_unevaluated_for_typeck(uneval);
    if (auto tree = std::get_if<std::optional<const_eval::ValTree>>(&structured); tree && *tree) {
        return std::move(const_to_pat(const_eval::Const::from_valtree(ty, **tree), span)->kind);
    }

    auto opaque = ctx.oracle.eval_unevaluated(uneval);
    if (auto val = std::get_if<const_eval::ConstValue>(&opaque)) {
        return std::move(const_to_pat(const_eval::Const::from_value(ty, *val), span)->kind);
    }
    const auto& failure = std::get<const_eval::EvalError>(opaque);
    if (failure.kind == const_eval::EvalError::Kind::TooGeneric) {
        trace("inline const is too generic");
        return Error{error(ErrorKind::ConstantEvaluationTooGeneric,
                           "constant pattern depends on a generic parameter", span)};
    }
    Diagnostic reported = failure.diagnostic;
    if (!reported.span.is_valid()) {
        reported.span = span;
    }
    trace("inline const failed: " + reported.message);
    return Error{ctx.diagnostics.emit(std::move(reported))};
}

} // namespace thir::detail
