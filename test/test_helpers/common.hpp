#pragma once

#include "gtest/gtest.h"

#include "const/const.hpp"
#include "const/table_oracle.hpp"
#include "hir/hir.hpp"
#include "hir/typeck_results.hpp"
#include "thir/lower/const_to_pat.hpp"
#include "thir/lower/lower.hpp"
#include "thir/pattern.hpp"
#include "thir/pretty_print.hpp"
#include "type/helper.hpp"
#include "type/type.hpp"
#include "utils/error.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace test::helpers {

template <typename... Pats>
std::vector<hir::PatternPtr> pattern_list(Pats&&... pats) {
    std::vector<hir::PatternPtr> list;
    (list.push_back(std::forward<Pats>(pats)), ...);
    return list;
}

/**
 * @brief Base fixture for pattern lowering tests
 *
 * Owns a type context, typeck table, diagnostic sink, table-driven oracle and
 * the structural decomposer, plus builders for surface patterns that record
 * node types as they go. Common types and ADTs are registered in SetUp:
 *
 *   enum Option<T> { None, Some(T) }
 *   struct Point { x: i32, y: i32 }
 *   enum Wrapper { Only(u8) }          // single variant
 */
class PatternTestBase : public ::testing::Test {
protected:
    type::TypeContext types;
    hir::TypeckResults typeck;
    DiagnosticSink diagnostics;
    const_eval::TableConstEvaluator oracle{types};
    thir::StructuralConstToPat decomposer{types};
    thir::LoweringOptions options{.inline_const_literal_fast_path = true, .trace = false};

    type::TypeId i8_type = type::invalid_type_id;
    type::TypeId i32_type = type::invalid_type_id;
    type::TypeId i64_type = type::invalid_type_id;
    type::TypeId u8_type = type::invalid_type_id;
    type::TypeId u32_type = type::invalid_type_id;
    type::TypeId u64_type = type::invalid_type_id;
    type::TypeId f32_type = type::invalid_type_id;
    type::TypeId f64_type = type::invalid_type_id;
    type::TypeId bool_type = type::invalid_type_id;
    type::TypeId char_type = type::invalid_type_id;
    type::TypeId str_type = type::invalid_type_id;
    type::TypeId t_param = type::invalid_type_id;

    type::AdtId option_adt = 0;
    type::AdtId point_adt = 0;
    type::AdtId wrapper_adt = 0;
    type::TypeId option_i32 = type::invalid_type_id;
    type::TypeId point_type = type::invalid_type_id;
    type::TypeId wrapper_type = type::invalid_type_id;

    void SetUp() override {
        i8_type = types.primitive(type::PrimitiveKind::I8);
        i32_type = types.primitive(type::PrimitiveKind::I32);
        i64_type = types.primitive(type::PrimitiveKind::I64);
        u8_type = types.primitive(type::PrimitiveKind::U8);
        u32_type = types.primitive(type::PrimitiveKind::U32);
        u64_type = types.primitive(type::PrimitiveKind::U64);
        f32_type = types.primitive(type::PrimitiveKind::F32);
        f64_type = types.primitive(type::PrimitiveKind::F64);
        bool_type = types.primitive(type::PrimitiveKind::BOOL);
        char_type = types.primitive(type::PrimitiveKind::CHAR);
        str_type = types.primitive(type::PrimitiveKind::STR);
        t_param = types.param(0, "T");

        option_adt = types.register_adt("Option", type::AdtKind::Enum, {
            type::VariantInfo{.name = "None", .fields = {}},
            type::VariantInfo{.name = "Some", .fields = {type::FieldInfo{"0", t_param}}},
        }, 1);
        point_adt = types.register_adt("Point", type::AdtKind::Struct, {
            type::VariantInfo{.name = "Point", .fields = {type::FieldInfo{"x", i32_type}, type::FieldInfo{"y", i32_type}}},
        });
        wrapper_adt = types.register_adt("Wrapper", type::AdtKind::Enum, {
            type::VariantInfo{.name = "Only", .fields = {type::FieldInfo{"0", u8_type}}},
        });
        option_i32 = types.adt(option_adt, {i32_type});
        point_type = types.adt(point_adt);
        wrapper_type = types.adt(wrapper_adt);
    }

    thir::LoweringContext context() {
        return thir::LoweringContext{types, typeck, oracle, decomposer, diagnostics, options};
    }

    thir::PatPtr lower(const hir::Pattern& pat) {
        auto ctx = context();
        return thir::pat_from_hir(ctx, pat);
    }

    std::string print(const thir::Pat& pat) const { return thir::to_string(types, pat); }

    // --- ids and spans ---

    hir::HirId fresh(type::TypeId ty) {
        hir::HirId id = next_id++;
        typeck.set_node_type(id, ty);
        return id;
    }

    span::Span next_span(uint32_t length = 1) {
        span::Span sp{0, next_offset, next_offset + length};
        next_offset += length + 1;
        return sp;
    }

    // --- expressions ---

    hir::ExprPtr literal(hir::Literal::Value value, type::TypeId ty, bool negated = false) {
        auto sp = next_span(3);
        auto lit = std::make_unique<hir::Expr>(fresh(ty), hir::LiteralExpr{hir::Literal{std::move(value), sp}}, sp);
        if (!negated) {
            return lit;
        }
        return std::make_unique<hir::Expr>(fresh(ty), hir::NegateExpr{std::move(lit)}, sp);
    }

    hir::ExprPtr int_lit(uint64_t value, type::TypeId ty, bool negated = false) {
        return literal(hir::Literal::Integer{value}, ty, negated);
    }

    hir::ExprPtr float_lit(std::string symbol, type::TypeId ty, bool negated = false) {
        return literal(hir::Literal::Float{std::move(symbol)}, ty, negated);
    }

    hir::ExprPtr path_expr(hir::Res res, type::TypeId ty, type::GenericArgs args = {}) {
        auto sp = next_span(4);
        auto expr = std::make_unique<hir::Expr>(fresh(ty), hir::PathExpr{hir::QPath{{hir::Ident{"PATH", sp}}, sp}}, sp);
        typeck.set_qpath_res(expr->hir_id, res);
        if (!args.empty()) {
            typeck.set_node_args(expr->hir_id, std::move(args));
        }
        return expr;
    }

    hir::ExprPtr const_block(type::DefId def, type::TypeId ty, hir::ExprPtr body) {
        auto sp = next_span(9);
        hir::ConstBlock block{.def_id = def, .hir_id = fresh(ty), .body = std::move(body)};
        return std::make_unique<hir::Expr>(fresh(ty), hir::ConstBlockExpr{std::move(block)}, sp);
    }

    // --- patterns ---

    hir::PatternPtr pattern(type::TypeId ty, hir::PatternVariant value, uint32_t length = 5) {
        return std::make_unique<hir::Pattern>(fresh(ty), std::move(value), next_span(length));
    }

    hir::PatternPtr wild(type::TypeId ty) { return pattern(ty, hir::WildcardPattern{}); }

    hir::PatternPtr binding(std::string name, type::TypeId ty,
                            hir::BindingMode mode = hir::BindingMode::by_value(hir::Mutability::Not),
                            hir::PatternPtr subpattern = nullptr) {
        const hir::HirId id = fresh(ty);
        const span::Span pat_span = next_span(12);
        const span::Span ident_span{pat_span.file, pat_span.start, pat_span.start + static_cast<uint32_t>(name.size())};
        auto pat = std::make_unique<hir::Pattern>(id, hir::BindingPattern{
            .annotation = {},
            .var_id = id,
            .ident = hir::Ident{std::move(name), ident_span},
            .subpattern = std::move(subpattern),
        }, pat_span);
        typeck.set_binding_mode(id, mode);
        return pat;
    }

    hir::PatternPtr lit_pat(hir::ExprPtr expr, type::TypeId ty) {
        return pattern(ty, hir::LiteralPattern{std::move(expr)});
    }

    hir::PatternPtr range_pat(hir::ExprPtr lo, hir::ExprPtr hi, hir::RangeEnd end, type::TypeId ty) {
        return pattern(ty, hir::RangePattern{std::move(lo), std::move(hi), end});
    }

    hir::PatternPtr tuple_pat(std::vector<hir::PatternPtr> elements, type::TypeId ty,
                              std::optional<size_t> dotdot = std::nullopt) {
        return pattern(ty, hir::TuplePattern{std::move(elements), dotdot});
    }

    hir::PatternPtr tuple_struct_pat(hir::Res res, std::vector<hir::PatternPtr> elements, type::TypeId ty,
                                     std::optional<size_t> dotdot = std::nullopt) {
        auto pat = pattern(ty, hir::TupleStructPattern{
            .path = hir::QPath{},
            .elements = std::move(elements),
            .dotdot_pos = dotdot,
        });
        typeck.set_qpath_res(pat->hir_id, res);
        return pat;
    }

    hir::PatternPtr struct_pat(hir::Res res, std::vector<std::pair<size_t, hir::PatternPtr>> fields, type::TypeId ty) {
        hir::StructPattern strukt;
        for (auto& [index, sub] : fields) {
            hir::HirId field_id = next_id++;
            typeck.set_field_index(field_id, index);
            strukt.fields.push_back(hir::PatternField{
                .hir_id = field_id,
                .ident = hir::Ident{},
                .pattern = std::move(sub),
                .span = span::Span::invalid(),
            });
        }
        auto pat = pattern(ty, std::move(strukt));
        typeck.set_qpath_res(pat->hir_id, res);
        return pat;
    }

    hir::PatternPtr path_pat(hir::Res res, type::TypeId ty, type::GenericArgs args = {}) {
        auto pat = pattern(ty, hir::PathPattern{hir::QPath{}});
        typeck.set_qpath_res(pat->hir_id, res);
        if (!args.empty()) {
            typeck.set_node_args(pat->hir_id, std::move(args));
        }
        return pat;
    }

    hir::PatternPtr ref_pat(hir::PatternPtr sub, type::TypeId ty) {
        return pattern(ty, hir::ReferencePattern{std::move(sub), hir::Mutability::Not});
    }

    hir::PatternPtr box_pat(hir::PatternPtr sub, type::TypeId ty) {
        return pattern(ty, hir::BoxPattern{std::move(sub)});
    }

    hir::PatternPtr slice_pat(std::vector<hir::PatternPtr> prefix, hir::PatternPtr middle,
                              std::vector<hir::PatternPtr> suffix, type::TypeId ty) {
        return pattern(ty, hir::SlicePattern{std::move(prefix), std::move(middle), std::move(suffix)});
    }

    hir::PatternPtr or_pat(std::vector<hir::PatternPtr> alternatives, type::TypeId ty) {
        return pattern(ty, hir::OrPattern{std::move(alternatives)});
    }

    // --- definitions ---

    hir::Res some_ctor() const {
        return hir::Res::def(type::DefKind::VariantCtor, types.get_adt(option_adt).variants[1].ctor_id);
    }
    hir::Res none_ctor() const {
        return hir::Res::def(type::DefKind::VariantCtor, types.get_adt(option_adt).variants[0].ctor_id);
    }

    // A free constant `NAME` evaluating to `value` of type `ty`.
    hir::Res define_const(std::string name, const_eval::ValTree value) {
        type::DefId def = types.register_def(type::DefKind::Const, std::move(name));
        oracle.define_value(def, std::move(value));
        return hir::Res::def(type::DefKind::Const, def);
    }

    // --- constants ---

    const_eval::Const scalar(type::TypeId ty, uint64_t bits) {
        auto kind = type::helper::primitive_kind(types, ty);
        const auto size = static_cast<uint8_t>(type::helper::bit_width(*kind) / 8);
        return const_eval::Const::from_bits(ty, bits, size);
    }

    static uint64_t leaf_bits(const const_eval::Const& value) {
        const auto* tree = value.as_valtree();
        if (!tree || !tree->is_leaf()) {
            ADD_FAILURE() << "expected a scalar valtree";
            return 0;
        }
        return tree->as_leaf()->bits;
    }

    const Diagnostic& only_diagnostic() const {
        EXPECT_EQ(diagnostics.count(), 1u);
        if (diagnostics.empty()) {
            throw std::runtime_error("no diagnostic was emitted");
        }
        return diagnostics.all().front();
    }

private:
    hir::HirId next_id = 1;
    uint32_t next_offset = 0;
};

} // namespace test::helpers
