#include "thir/lower/lower_internal.hpp"

#include "const/compare.hpp"
#include "thir/pretty_print.hpp"
#include "type/helper.hpp"
#include "utils/debug_context.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace thir::detail {

std::variant<RangeEndpoint, DiagnosticId> PatternLowerer::lower_pattern_range_endpoint(const hir::Expr* expr) {
    if (!expr) {
        return RangeEndpoint{};
    }

    PatKind kind = lower_lit(*expr);

    // An associated constant endpoint comes back wrapped in its ascription.
    std::optional<Ascription> ascription;
    if (auto ascribe = std::get_if<AscribeUserType>(&kind)) {
        ascription = ascribe->ascription;
        PatKind inner = std::move(ascribe->subpattern->kind);
        kind = std::move(inner);
    }

    if (auto constant = std::get_if<Constant>(&kind)) {
        return RangeEndpoint{.value = constant->value, .ascription = std::move(ascription)};
    }
    if (auto failed = std::get_if<Error>(&kind)) {
        return failed->diagnostic;
    }
    return error(ErrorKind::InvalidRangeEndpoint,
                 "range pattern endpoint must be a single constant value", expr->span);
}

std::optional<DiagnosticId> PatternLowerer::error_on_literal_overflow(const hir::Expr* expr, TypeId ty) {
    if (!expr) {
        return std::nullopt;
    }

    bool negated = false;
    const hir::Expr* lit_expr = expr;
    if (auto negate = std::get_if<hir::NegateExpr>(&expr->value)) {
        negated = true;
        lit_expr = negate->operand.get();
    }
    if (!lit_expr) {
        return std::nullopt;
    }
    const auto* lit = std::get_if<hir::LiteralExpr>(&lit_expr->value);
    if (!lit) {
        return std::nullopt;
    }
    const auto* integer = std::get_if<hir::Literal::Integer>(&lit->literal.value);
    if (!integer) {
        return std::nullopt;
    }

    const auto kind = type::helper::primitive_kind(ctx.types, ty);
    if (!kind || !type::helper::is_integer(*kind)) {
        return std::nullopt;
    }

    uint64_t max = 0;
    std::string min_text;
    std::string max_text;
    if (type::helper::is_signed_int(*kind)) {
        max = static_cast<uint64_t>(type::helper::signed_int_max(*kind));
        min_text = std::to_string(type::helper::signed_int_min(*kind));
        max_text = std::to_string(type::helper::signed_int_max(*kind));
    } else {
        max = type::helper::unsigned_int_max(*kind);
        min_text = "0";
        max_text = std::to_string(max);
    }

    // A negated literal may reach `max + 1`, e.g. `-128i8`.
    const uint64_t value = integer->value;
    const bool overflows = negated ? (value != 0 && value - 1 > max) : value > max;
    if (!overflows) {
        return std::nullopt;
    }

    const std::string ty_name = ctx.types.to_string(ty);
    const std::string lit_text = (negated ? "-" : "") + std::to_string(value);
    return error(ErrorKind::LiteralOverflow,
                 "literal out of range for `" + ty_name + "`",
                 expr->span,
                 {"the literal `" + lit_text + "` does not fit into the type `" + ty_name +
                  "` whose range is `" + min_text + "..=" + max_text + "`"});
}

RangeResult PatternLowerer::lower_pattern_range(const hir::Expr* lo_expr, const hir::Expr* hi_expr,
                                                hir::RangeEnd end, TypeId ty, span::Span span) {
    if (!lo_expr && !hi_expr) {
        throw std::logic_error(debug::format_with_context("range pattern with neither bound"));
    }

    auto lo_result = lower_pattern_range_endpoint(lo_expr);
    if (auto id = std::get_if<DiagnosticId>(&lo_result)) {
        return *id;
    }
    auto hi_result = lower_pattern_range_endpoint(hi_expr);
    if (auto id = std::get_if<DiagnosticId>(&hi_result)) {
        return *id;
    }
    RangeEndpoint lo = std::move(std::get<RangeEndpoint>(lo_result));
    RangeEndpoint hi = std::move(std::get<RangeEndpoint>(hi_result));

    // Open bounds stand for the extremes of the type.
    auto extreme = [&](bool minimum) {
        const auto kind = type::helper::primitive_kind(ctx.types, ty);
        const auto bits = kind ? (minimum ? type::helper::numeric_min_bits(*kind)
                                          : type::helper::numeric_max_bits(*kind))
                               : std::nullopt;
        if (!bits) {
            throw std::logic_error(debug::format_with_context(
                "half-open range over non-numeric type " + ctx.types.to_string(ty)));
        }
        const auto size = static_cast<uint8_t>(type::helper::bit_width(*kind) / 8);
        return const_eval::Const::from_bits(ty, *bits, size);
    };
    const const_eval::Const lo_value = lo.value ? *lo.value : extreme(true);
    const const_eval::Const hi_value = hi.value ? *hi.value : extreme(false);

    if (lo_value.ty != ty || hi_value.ty != ty) {
        throw std::logic_error(debug::format_with_context(
            "range endpoint types " + ctx.types.to_string(lo_value.ty) + " and " +
            ctx.types.to_string(hi_value.ty) + " do not match pattern type " + ctx.types.to_string(ty)));
    }

    const auto cmp = const_eval::compare_const_vals(ctx.types, lo_value, hi_value, ctx.oracle);

    PatKind kind = Wild{};
    if (cmp == std::strong_ordering::less) {
        kind = Range{.lo = lo_value, .hi = hi_value, .end = end};
    } else if (end == hir::RangeEnd::Included && cmp == std::strong_ordering::equal) {
        kind = Constant{lo_value};
    } else {
        // A wrapped literal can look like `lo > hi`; report the overflow instead.
        if (auto id = error_on_literal_overflow(lo_expr, ty)) {
            return *id;
        }
        if (auto id = error_on_literal_overflow(hi_expr, ty)) {
            return *id;
        }
        if (end == hir::RangeEnd::Excluded) {
            return error(ErrorKind::MalformedRange, "lower range bound must be less than upper", span);
        }
        return error(ErrorKind::MalformedRange, "lower range bound must be less than or equal to upper", span);
    }

    if (ctx.options.trace) {
        trace("range " + to_string(ctx.types, lo_value) + (end == hir::RangeEnd::Included ? "..=" : "..") +
              to_string(ctx.types, hi_value) +
              (std::holds_alternative<Constant>(kind) ? " is a single value" : " is non-empty"));
    }

    // Ascriptions from associated-constant bounds: lo innermost, then hi.
    for (auto* ascription : {&lo.ascription, &hi.ascription}) {
        if (*ascription) {
            kind = AscribeUserType{
                .ascription = **ascription,
                .subpattern = make_pat(ty, span, std::move(kind)),
            };
        }
    }
    return RangeResult{std::move(kind)};
}

} // namespace thir::detail
