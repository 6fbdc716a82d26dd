#include "test_helpers/common.hpp"

using namespace test::helpers;

class LowerConstTest : public PatternTestBase {
protected:
    // `<T as Bounded>::MAX`, declared on the trait.
    type::DefId declare_max() {
        auto trait = types.register_def(type::DefKind::Trait, "Bounded");
        auto max = types.register_def(type::DefKind::AssocConst, "MAX", trait);
        oracle.declare_assoc_const(max);
        return max;
    }
};

TEST_F(LowerConstTest, NamedConstantBecomesConstant) {
    auto answer = define_const("ANSWER", const_eval::ValTree::leaf(42, 4));
    auto lowered = lower(*path_pat(answer, u32_type));

    ASSERT_TRUE(lowered->is<thir::Constant>());
    EXPECT_EQ(leaf_bits(lowered->as<thir::Constant>()->value), 42u);
    EXPECT_EQ(lowered->ty, u32_type);
    EXPECT_TRUE(diagnostics.empty());
}

TEST_F(LowerConstTest, StructuredConstantIsDecomposed) {
    auto origin = define_const("ORIGIN", const_eval::ValTree::branch({
        const_eval::ValTree::leaf(1, 4),
        const_eval::ValTree::leaf(static_cast<uint32_t>(-2), 4),
    }));
    auto lowered = lower(*path_pat(origin, point_type));

    ASSERT_TRUE(lowered->is<thir::Leaf>());
    EXPECT_EQ(print(*lowered), "Point(0: 1i32, 1: -2i32)");
}

TEST_F(LowerConstTest, EnumConstantBecomesVariant) {
    auto fallback = define_const("FALLBACK", const_eval::ValTree::branch({
        const_eval::ValTree::leaf(1, 4),
        const_eval::ValTree::leaf(7, 4),
    }));
    auto lowered = lower(*path_pat(fallback, option_i32));

    const auto* variant = lowered->as<thir::Variant>();
    ASSERT_NE(variant, nullptr);
    EXPECT_EQ(variant->variant_index, 1u);
    EXPECT_EQ(variant->args, type::GenericArgs{i32_type});
    EXPECT_EQ(print(*lowered), "Option::Some(0: 7i32)");
}

TEST_F(LowerConstTest, ConstantWithoutValtreeIsMatchedOpaquely) {
    auto def = types.register_def(type::DefKind::Const, "BLOB");
    oracle.define_opaque(def, const_eval::IndirectValue{{1, 2, 3}});
    auto lowered = lower(*path_pat(hir::Res::def(type::DefKind::Const, def), point_type));

    ASSERT_TRUE(lowered->is<thir::Constant>());
    const auto& value = lowered->as<thir::Constant>()->value;
    EXPECT_EQ(value.as_valtree(), nullptr);
    EXPECT_EQ(print(*lowered), "<opaque 3 bytes>");
}

TEST_F(LowerConstTest, UnresolvedAssociatedConstantOnlyBreaksItsArm) {
    auto max = declare_max();
    auto ctx = context();
    auto arms = pattern_list(
        path_pat(hir::Res::def(type::DefKind::AssocConst, max), u32_type, {t_param}),
        lit_pat(int_lit(0, u32_type), u32_type),
        wild(u32_type));
    auto lowered = thir::pats_from_hir(ctx, arms);

    ASSERT_EQ(lowered.size(), 3u);
    ASSERT_TRUE(lowered[0]->is<thir::Error>());
    EXPECT_TRUE(lowered[1]->is<thir::Constant>());
    EXPECT_TRUE(lowered[2]->is<thir::Wild>());

    const auto& diag = only_diagnostic();
    EXPECT_EQ(diag.kind, ErrorKind::AssociatedConstantUnresolved);
    EXPECT_EQ(diag.span, arms[0]->span);
    EXPECT_EQ(oracle.evaluation_count(), 0u);
}

TEST_F(LowerConstTest, ResolvedAssociatedConstantKeepsUserType) {
    auto max = declare_max();
    auto impl_max = types.register_def(type::DefKind::AssocConst, "MAX");
    oracle.register_assoc_impl(max, u8_type, impl_max);
    oracle.define_value(impl_max, const_eval::ValTree::leaf(255, 1));

    auto pat = path_pat(hir::Res::def(type::DefKind::AssocConst, max), u8_type, {u8_type});
    const hir::UserType user_ty{
        .kind = hir::UserType::Kind::TypeOf,
        .ty = type::invalid_type_id,
        .def_id = max,
        .args = {u8_type},
    };
    typeck.set_user_provided_type(pat->hir_id, user_ty);
    auto lowered = lower(*pat);

    const auto* ascribe = lowered->as<thir::AscribeUserType>();
    ASSERT_NE(ascribe, nullptr);
    EXPECT_EQ(ascribe->ascription.variance, thir::Variance::Contravariant);
    EXPECT_EQ(ascribe->ascription.annotation.user_ty, user_ty);
    EXPECT_EQ(ascribe->ascription.annotation.inferred_ty, u8_type);
    EXPECT_EQ(ascribe->ascription.annotation.span, pat->span);
    ASSERT_TRUE(ascribe->subpattern->is<thir::Constant>());
    EXPECT_EQ(leaf_bits(ascribe->subpattern->as<thir::Constant>()->value), 255u);
    EXPECT_EQ(print(*lowered), "(255u8 : -typeof(MAX))");
}

TEST_F(LowerConstTest, FreeConstantIgnoresUserType) {
    auto answer = define_const("ANSWER", const_eval::ValTree::leaf(1, 4));
    auto pat = path_pat(answer, u32_type);
    typeck.set_user_provided_type(pat->hir_id, hir::UserType{
        .kind = hir::UserType::Kind::Ty,
        .ty = u32_type,
        .def_id = type::invalid_def_id,
        .args = {},
    });
    auto lowered = lower(*pat);

    EXPECT_TRUE(lowered->is<thir::Constant>());
}

TEST_F(LowerConstTest, GenericConstantIsTooGeneric) {
    auto def = types.register_def(type::DefKind::Const, "SIZE");
    oracle.define_too_generic(def);
    auto lowered = lower(*path_pat(hir::Res::def(type::DefKind::Const, def), u64_type, {t_param}));

    ASSERT_TRUE(lowered->is<thir::Error>());
    EXPECT_EQ(only_diagnostic().kind, ErrorKind::ConstantEvaluationTooGeneric);
}

TEST_F(LowerConstTest, FailedEvaluationCarriesTheEvaluatorMessage) {
    auto def = types.register_def(type::DefKind::Const, "BROKEN");
    oracle.define_failure(def, "attempt to divide by zero");
    auto lowered = lower(*path_pat(hir::Res::def(type::DefKind::Const, def), i32_type));

    ASSERT_TRUE(lowered->is<thir::Error>());
    const auto& diag = only_diagnostic();
    EXPECT_EQ(diag.kind, ErrorKind::ConstantEvaluationFailed);
    ASSERT_EQ(diag.notes.size(), 1u);
    EXPECT_EQ(diag.notes[0], "attempt to divide by zero");
}

TEST_F(LowerConstTest, FailedResolutionIsReported) {
    auto def = types.register_def(type::DefKind::Const, "CYCLE");
    oracle.mark_resolution_failure(def);
    auto lowered = lower(*path_pat(hir::Res::def(type::DefKind::Const, def), i32_type));

    ASSERT_TRUE(lowered->is<thir::Error>());
    EXPECT_EQ(only_diagnostic().kind, ErrorKind::ConstantEvaluationFailed);
}

TEST_F(LowerConstTest, InlineLiteralSkipsTheEvaluator) {
    auto block_def = types.register_def(type::DefKind::InlineConst, "{inline const}");
    auto pat = lit_pat(const_block(block_def, i32_type, int_lit(5, i32_type, true)), i32_type);
    auto lowered = lower(*pat);

    ASSERT_TRUE(lowered->is<thir::Constant>());
    EXPECT_EQ(print(*lowered), "-5i32");
    EXPECT_EQ(oracle.evaluation_count(), 0u);
}

TEST_F(LowerConstTest, InlineConstantIsEvaluatedWithoutTheFastPath) {
    options.inline_const_literal_fast_path = false;
    auto block_def = types.register_def(type::DefKind::InlineConst, "{inline const}");
    oracle.define_value(block_def, const_eval::ValTree::leaf(5, 4));
    auto pat = lit_pat(const_block(block_def, i32_type, int_lit(5, i32_type)), i32_type);
    auto lowered = lower(*pat);

    ASSERT_TRUE(lowered->is<thir::Constant>());
    EXPECT_EQ(leaf_bits(lowered->as<thir::Constant>()->value), 5u);
    EXPECT_GT(oracle.evaluation_count(), 0u);
}

TEST_F(LowerConstTest, GenericInlineConstantIsTooGeneric) {
    const auto usize_type = types.primitive(type::PrimitiveKind::USIZE);
    auto block_def = types.register_def(type::DefKind::InlineConst, "{inline const}");
    oracle.define_too_generic(block_def);
    auto n = types.register_def(type::DefKind::ConstParam, "N");
    auto body = path_expr(hir::Res::def(type::DefKind::ConstParam, n), usize_type);
    auto pat = lit_pat(const_block(block_def, usize_type, std::move(body)), usize_type);
    auto lowered = lower(*pat);

    ASSERT_TRUE(lowered->is<thir::Error>());
    EXPECT_EQ(only_diagnostic().kind, ErrorKind::ConstantEvaluationTooGeneric);
}

TEST_F(LowerConstTest, FailingInlineConstantReportsAtTheBlock) {
    auto block_def = types.register_def(type::DefKind::InlineConst, "{inline const}");
    oracle.define_failure(block_def, "index out of bounds");
    auto expr = const_block(block_def, u8_type, path_expr(hir::Res::err(), u8_type));
    const span::Span block_span = expr->span;
    auto lowered = lower(*lit_pat(std::move(expr), u8_type));

    ASSERT_TRUE(lowered->is<thir::Error>());
    const auto& diag = only_diagnostic();
    EXPECT_EQ(diag.kind, ErrorKind::ConstantEvaluationFailed);
    EXPECT_EQ(diag.message, "index out of bounds");
    EXPECT_EQ(diag.span, block_span);
}
