#pragma once

#include "const/oracle.hpp"
#include "hir/hir.hpp"
#include "hir/typeck_results.hpp"
#include "thir/lower/const_to_pat.hpp"
#include "thir/pattern.hpp"
#include "type/type.hpp"
#include "utils/debug_context.hpp"
#include "utils/error.hpp"

#include <variant>
#include <vector>

namespace thir {

struct LoweringOptions {
    // Evaluate `const { 5 }` and `const { -5 }` directly as literals.
    bool inline_const_literal_fast_path = true;
    // `[PAT DEBUG]` traces on stderr.
    bool trace = debug::env_flag("DEBUG_PATTERN_LOWERING");
};

// Everything lowering reads from the rest of the compiler. Only `diagnostics`
// (and interning in `types`) is written to.
struct LoweringContext {
    type::TypeContext& types;
    const hir::TypeckResults& typeck;
    const_eval::ConstEvalOracle& oracle;
    ConstToPat& const_to_pat;
    DiagnosticSink& diagnostics;
    LoweringOptions options{};
};

// A well-formed pattern kind, or the diagnostic explaining why there is none.
using RangeResult = std::variant<PatKind, DiagnosticId>;

/**
 * @brief Lowers one surface pattern into the typed pattern IR.
 *
 * Never fails for user errors: a malformed fragment becomes an Error node
 * whose diagnostic is in `ctx.diagnostics`. Inconsistent type-checking input
 * throws std::logic_error.
 */
PatPtr pat_from_hir(LoweringContext& ctx, const hir::Pattern& pattern);

// Lowers each pattern independently, e.g. the arms of one match.
std::vector<PatPtr> pats_from_hir(LoweringContext& ctx, const std::vector<hir::PatternPtr>& patterns);

// Resolves a range pattern with at least one bound against `ty`.
RangeResult lower_range(LoweringContext& ctx, const hir::Expr* lo, const hir::Expr* hi,
                        hir::RangeEnd end, type::TypeId ty, span::Span span);

} // namespace thir
