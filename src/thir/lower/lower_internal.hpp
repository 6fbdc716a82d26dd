#pragma once

#include "thir/lower/lower.hpp"

#include "const/const.hpp"
#include "hir/hir.hpp"
#include "thir/pattern.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace thir::detail {

// One evaluated range bound. An absent bound has neither value nor ascription.
struct RangeEndpoint {
    std::optional<const_eval::Const> value;
    std::optional<Ascription> ascription;
};

struct PatternLowerer {
    explicit PatternLowerer(LoweringContext& ctx) : ctx(ctx) {}

    // Lowers the pattern and wraps it in one Deref per recorded adjustment.
    PatPtr lower_pattern(const hir::Pattern& pat);

    RangeResult lower_pattern_range(const hir::Expr* lo_expr, const hir::Expr* hi_expr,
                                    hir::RangeEnd end, TypeId ty, span::Span span);

private:
    LoweringContext& ctx;

    // lower_pattern.cpp
    PatPtr lower_pattern_unadjusted(const hir::Pattern& pat);
    PatPtr lower_opt_pattern(const hir::PatternPtr& pat);
    std::vector<PatPtr> lower_patterns(const std::vector<hir::PatternPtr>& pats);
    std::vector<FieldPat> lower_tuple_subpats(const std::vector<hir::PatternPtr>& pats,
                                              size_t expected_len,
                                              std::optional<size_t> gap_pos);
    PatKind slice_or_array_pattern(TypeId ty, const hir::SlicePattern& slice);
    PatPtr lower_binding(const hir::Pattern& pat, const hir::BindingPattern& binding, TypeId ty);

    // lower_range.cpp
    std::variant<RangeEndpoint, DiagnosticId> lower_pattern_range_endpoint(const hir::Expr* expr);
    std::optional<DiagnosticId> error_on_literal_overflow(const hir::Expr* expr, TypeId ty);

    // lower_const.cpp
    PatKind lower_lit(const hir::Expr& expr);
    PatPtr lower_path(const hir::QPath& qpath, hir::HirId id, span::Span span);
    PatKind lower_inline_const(const hir::ConstBlock& block, hir::HirId id, span::Span span);
    PatPtr const_to_pat(const const_eval::Const& value, span::Span span);

    // lower_variant.cpp
    PatKind lower_variant_or_leaf(hir::Res res, hir::HirId id, span::Span span, TypeId ty,
                                  std::vector<FieldPat> subpatterns);
    const type::VariantInfo& variant_of_res(type::AdtId adt, const hir::Res& res) const;

    DiagnosticId error(ErrorKind kind, std::string message, span::Span span,
                       std::vector<std::string> notes = {});
    void trace(const std::string& message) const;
};

} // namespace thir::detail
