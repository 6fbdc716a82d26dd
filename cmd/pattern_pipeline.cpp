#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "src/const/const.hpp"
#include "src/const/table_oracle.hpp"
#include "src/hir/hir.hpp"
#include "src/hir/typeck_results.hpp"
#include "src/thir/lower/const_to_pat.hpp"
#include "src/thir/lower/lower.hpp"
#include "src/thir/pretty_print.hpp"
#include "src/type/type.hpp"
#include "src/utils/error.hpp"

namespace {

// Everything one scenario needs, as a type checker would have left it.
struct Session {
    type::TypeContext types;
    hir::TypeckResults typeck;
    DiagnosticSink diagnostics;
    const_eval::TableConstEvaluator oracle{types};
    thir::StructuralConstToPat decomposer{types};
    hir::HirId next_id = 1;
    uint32_t next_offset = 0;

    thir::LoweringContext context() {
        return thir::LoweringContext{types, typeck, oracle, decomposer, diagnostics};
    }

    hir::HirId fresh(type::TypeId ty) {
        hir::HirId id = next_id++;
        typeck.set_node_type(id, ty);
        return id;
    }

    span::Span span_of(uint32_t length) {
        span::Span sp{0, next_offset, next_offset + length};
        next_offset += length + 1;
        return sp;
    }

    hir::ExprPtr int_lit(uint64_t value, type::TypeId ty, bool negated = false) {
        auto sp = span_of(static_cast<uint32_t>(std::to_string(value).size()));
        auto lit = std::make_unique<hir::Expr>(fresh(ty),
                                               hir::LiteralExpr{hir::Literal{hir::Literal::Integer{value}, sp}},
                                               sp);
        if (!negated) {
            return lit;
        }
        return std::make_unique<hir::Expr>(fresh(ty), hir::NegateExpr{std::move(lit)}, sp);
    }

    hir::PatternPtr pattern(type::TypeId ty, hir::PatternVariant value, uint32_t length = 1) {
        return std::make_unique<hir::Pattern>(fresh(ty), std::move(value), span_of(length));
    }
};

struct Scenario {
    std::string name;
    std::string source;
    std::function<std::vector<hir::PatternPtr>(Session&)> build;
};

std::vector<hir::PatternPtr> single(hir::PatternPtr pat) {
    std::vector<hir::PatternPtr> pats;
    pats.push_back(std::move(pat));
    return pats;
}

hir::PatternPtr range(Session& s, type::TypeId ty, hir::ExprPtr lo, hir::ExprPtr hi, hir::RangeEnd end) {
    return s.pattern(ty, hir::RangePattern{std::move(lo), std::move(hi), end}, 8);
}

std::vector<Scenario> scenarios() {
    std::vector<Scenario> all;

    all.push_back(Scenario{"overflow", "-130i8..2i8", [](Session& s) {
        auto i8 = s.types.primitive(type::PrimitiveKind::I8);
        return single(range(s, i8, s.int_lit(130, i8, true), s.int_lit(2, i8), hir::RangeEnd::Excluded));
    }});

    all.push_back(Scenario{"inclusive", "0..=5 (u8)", [](Session& s) {
        auto u8 = s.types.primitive(type::PrimitiveKind::U8);
        return single(range(s, u8, s.int_lit(0, u8), s.int_lit(5, u8), hir::RangeEnd::Included));
    }});

    all.push_back(Scenario{"single", "5..=5 (u8)", [](Session& s) {
        auto u8 = s.types.primitive(type::PrimitiveKind::U8);
        return single(range(s, u8, s.int_lit(5, u8), s.int_lit(5, u8), hir::RangeEnd::Included));
    }});

    all.push_back(Scenario{"deref", "Some(n) against &&Option<i32>", [](Session& s) {
        auto i32 = s.types.primitive(type::PrimitiveKind::I32);
        auto param = s.types.param(0, "T");
        auto option = s.types.register_adt("Option", type::AdtKind::Enum, {
            type::VariantInfo{.name = "None", .fields = {}},
            type::VariantInfo{.name = "Some", .fields = {type::FieldInfo{"0", param}}},
        }, 1);
        auto option_i32 = s.types.adt(option, {i32});
        auto ref_option = s.types.reference(option_i32);
        auto ref_ref_option = s.types.reference(ref_option);
        auto ref_i32 = s.types.reference(i32);

        auto n_span = s.span_of(1);
        auto n = std::make_unique<hir::Pattern>(s.fresh(ref_i32), hir::BindingPattern{
            .annotation = {},
            .var_id = 0,
            .ident = hir::Ident{"n", n_span},
            .subpattern = nullptr,
        }, n_span);
        std::get<hir::BindingPattern>(n->value).var_id = n->hir_id;
        s.typeck.set_binding_mode(n->hir_id, hir::BindingMode::by_reference(hir::Mutability::Not));

        std::vector<hir::PatternPtr> elements;
        elements.push_back(std::move(n));
        auto some = s.pattern(option_i32, hir::TupleStructPattern{
            .path = hir::QPath{{hir::Ident{"Some", s.span_of(4)}}, s.span_of(4)},
            .elements = std::move(elements),
            .dotdot_pos = std::nullopt,
        }, 7);
        s.typeck.set_qpath_res(some->hir_id, hir::Res::def(type::DefKind::VariantCtor,
                                                           s.types.get_adt(option).variants[1].ctor_id));
        s.typeck.set_pat_adjustments(some->hir_id, {ref_ref_option, ref_option});
        return single(std::move(some));
    }});

    all.push_back(Scenario{"assoc", "match x { <T as Bounded>::MAX => .., 0 => .., _ => .. }", [](Session& s) {
        auto u32 = s.types.primitive(type::PrimitiveKind::U32);
        auto param = s.types.param(0, "T");
        auto trait = s.types.register_def(type::DefKind::Trait, "Bounded");
        auto max = s.types.register_def(type::DefKind::AssocConst, "MAX", trait);
        s.oracle.declare_assoc_const(max);

        std::vector<hir::PatternPtr> arms;
        auto path = s.pattern(u32, hir::PathPattern{hir::QPath{{hir::Ident{"MAX", s.span_of(3)}}, s.span_of(17)}}, 17);
        s.typeck.set_qpath_res(path->hir_id, hir::Res::def(type::DefKind::AssocConst, max));
        s.typeck.set_node_args(path->hir_id, {param});
        arms.push_back(std::move(path));
        arms.push_back(s.pattern(u32, hir::LiteralPattern{s.int_lit(0, u32)}));
        arms.push_back(s.pattern(u32, hir::WildcardPattern{}));
        return arms;
    }});

    return all;
}

void print_diagnostic(const Diagnostic& diag) {
    std::cout << "  error[" << diag.kind << "]: " << diag.message << " (" << diag.span << ")" << std::endl;
    for (const auto& note : diag.notes) {
        std::cout << "    note: " << note << std::endl;
    }
}

void run(const Scenario& scenario, bool strict) {
    Session session;
    auto pats = scenario.build(session);
    auto ctx = session.context();
    auto lowered = thir::pats_from_hir(ctx, pats);

    std::cout << scenario.name << ": " << scenario.source << std::endl;
    for (const auto& pat : lowered) {
        std::cout << "  => " << thir::to_string(session.types, *pat)
                  << " : " << session.types.to_string(pat->ty) << std::endl;
    }
    for (const auto& diag : session.diagnostics.all()) {
        print_diagnostic(diag);
    }
    if (strict) {
        session.diagnostics.raise_first();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    bool strict = false;
    std::string selected;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--strict") {
            strict = true;
        } else if (selected.empty() && !arg.empty() && arg[0] != '-') {
            selected = arg;
        } else {
            std::cerr << "Usage: " << argv[0] << " [--strict] [scenario]" << std::endl;
            return 1;
        }
    }

    try {
        bool found = false;
        for (const auto& scenario : scenarios()) {
            if (!selected.empty() && scenario.name != selected) {
                continue;
            }
            found = true;
            run(scenario, strict);
        }
        if (!found) {
            std::cerr << "Error: unknown scenario '" << selected << "'" << std::endl;
            std::cerr << "Available: overflow, inclusive, single, deref, assoc" << std::endl;
            return 1;
        }
        return 0;
    } catch (const SemanticError& e) {
        std::cerr << "Error: " << e.what() << " (" << e.span() << ")" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
