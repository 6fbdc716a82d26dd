#include "const/compare.hpp"
#include "const/table_oracle.hpp"
#include "type/helper.hpp"
#include "type/type.hpp"

#include <gtest/gtest.h>

#include <bit>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace const_eval;

class ConstCompareTest : public ::testing::Test {
protected:
    type::TypeContext types;
    TableConstEvaluator oracle{types};

    type::TypeId i8_type = types.primitive(type::PrimitiveKind::I8);
    type::TypeId i64_type = types.primitive(type::PrimitiveKind::I64);
    type::TypeId u8_type = types.primitive(type::PrimitiveKind::U8);
    type::TypeId u64_type = types.primitive(type::PrimitiveKind::U64);
    type::TypeId char_type = types.primitive(type::PrimitiveKind::CHAR);
    type::TypeId f32_type = types.primitive(type::PrimitiveKind::F32);
    type::TypeId f64_type = types.primitive(type::PrimitiveKind::F64);

    Const i8_const(int8_t value) {
        return Const::from_bits(i8_type, static_cast<uint8_t>(value), 1);
    }
    Const f32_const(float value) {
        return Const::from_bits(f32_type, std::bit_cast<uint32_t>(value), 4);
    }
    Const f64_const(double value) {
        return Const::from_bits(f64_type, std::bit_cast<uint64_t>(value), 8);
    }

    std::optional<std::strong_ordering> compare(const Const& a, const Const& b) {
        return compare_const_vals(types, a, b, oracle);
    }
};

TEST_F(ConstCompareTest, SignedIntegersCompareAfterSignExtension) {
    // -1i8 is 0xFF, which would sort after 1 as raw bits.
    EXPECT_EQ(compare(i8_const(-1), i8_const(1)), std::strong_ordering::less);
    EXPECT_EQ(compare(i8_const(-128), i8_const(127)), std::strong_ordering::less);
    EXPECT_EQ(compare(i8_const(5), i8_const(5)), std::strong_ordering::equal);

    Const min64 = Const::from_bits(i64_type, static_cast<uint64_t>(std::numeric_limits<int64_t>::min()), 8);
    Const zero64 = Const::from_bits(i64_type, 0, 8);
    EXPECT_EQ(compare(min64, zero64), std::strong_ordering::less);
}

TEST_F(ConstCompareTest, UnsignedIntegersCompareByBits) {
    EXPECT_EQ(compare(Const::from_bits(u8_type, 0xFF, 1), Const::from_bits(u8_type, 1, 1)),
              std::strong_ordering::greater);
    EXPECT_EQ(compare(Const::from_bits(u64_type, std::numeric_limits<uint64_t>::max(), 8),
                      Const::from_bits(u64_type, 0, 8)),
              std::strong_ordering::greater);
    EXPECT_EQ(compare(Const::from_bits(char_type, 'a', 4), Const::from_bits(char_type, 'z', 4)),
              std::strong_ordering::less);
}

TEST_F(ConstCompareTest, OpaqueScalarsUseFastPath) {
    Const a = Const::from_value(u8_type, ScalarInt{3, 1});
    Const b = Const::from_value(u8_type, ScalarInt{9, 1});
    EXPECT_EQ(compare(a, b), std::strong_ordering::less);
    EXPECT_EQ(oracle.evaluation_count(), 0u);
}

TEST_F(ConstCompareTest, MixedRepresentationsCompareByValue) {
    Const tree = Const::from_bits(i8_type, static_cast<uint8_t>(-3), 1);
    Const opaque = Const::from_value(i8_type, ScalarInt{2, 1});
    EXPECT_EQ(compare(tree, opaque), std::strong_ordering::less);
    EXPECT_EQ(compare(opaque, tree), std::strong_ordering::greater);
}

TEST_F(ConstCompareTest, AntisymmetricOverNonNanValues) {
    const std::vector<int8_t> ints = {-128, -7, -1, 0, 1, 42, 127};
    for (int8_t a : ints) {
        for (int8_t b : ints) {
            auto ab = compare(i8_const(a), i8_const(b));
            auto ba = compare(i8_const(b), i8_const(a));
            ASSERT_TRUE(ab.has_value());
            ASSERT_TRUE(ba.has_value());
            EXPECT_EQ(*ab == std::strong_ordering::greater, *ba == std::strong_ordering::less)
                << static_cast<int>(a) << " vs " << static_cast<int>(b);
            EXPECT_EQ(*ab == std::strong_ordering::equal, a == b);
        }
    }

    const std::vector<double> floats = {-std::numeric_limits<double>::infinity(), -2.5, -0.0, 1.0, 1e300,
                                        std::numeric_limits<double>::infinity()};
    for (double a : floats) {
        for (double b : floats) {
            auto ab = compare(f64_const(a), f64_const(b));
            auto ba = compare(f64_const(b), f64_const(a));
            ASSERT_TRUE(ab.has_value());
            ASSERT_TRUE(ba.has_value());
            EXPECT_EQ(*ab == std::strong_ordering::greater, *ba == std::strong_ordering::less);
        }
    }
}

TEST_F(ConstCompareTest, NanIsIncomparable) {
    const float nan32 = std::numeric_limits<float>::quiet_NaN();
    const double nan64 = std::numeric_limits<double>::quiet_NaN();

    EXPECT_FALSE(compare(f32_const(nan32), f32_const(1.0f)).has_value());
    EXPECT_FALSE(compare(f32_const(1.0f), f32_const(nan32)).has_value());
    EXPECT_FALSE(compare(f32_const(nan32), f32_const(nan32)).has_value());
    EXPECT_FALSE(compare(f64_const(nan64), f64_const(-1.0)).has_value());
    EXPECT_FALSE(compare(f64_const(0.0), f64_const(nan64)).has_value());
}

TEST_F(ConstCompareTest, FloatsUseIeeeOrder) {
    // Raw bits of negative floats sort after positive ones.
    EXPECT_EQ(compare(f32_const(-1.5f), f32_const(0.5f)), std::strong_ordering::less);
    EXPECT_EQ(compare(f64_const(-0.0), f64_const(0.0)), std::strong_ordering::equal);
}

TEST_F(ConstCompareTest, UnevaluatedConstantsAreEvaluated) {
    type::DefId def = types.register_def(type::DefKind::Const, "LIMIT");
    oracle.define_value(def, ValTree::leaf(static_cast<uint8_t>(-10), 1));
    Const uneval = Const::unevaluated(i8_type, UnevaluatedConst{def, {}});

    EXPECT_EQ(compare(uneval, i8_const(0)), std::strong_ordering::less);
    EXPECT_GT(oracle.evaluation_count(), 0u);
}

TEST_F(ConstCompareTest, StructuredValuesCompareLexicographically) {
    auto pair = types.tuple({u8_type, u8_type});
    Const a = Const::from_valtree(pair, ValTree::branch({ValTree::leaf(1, 1), ValTree::leaf(9, 1)}));
    Const b = Const::from_valtree(pair, ValTree::branch({ValTree::leaf(2, 1), ValTree::leaf(0, 1)}));
    EXPECT_EQ(compare(a, b), std::strong_ordering::less);
    EXPECT_EQ(compare(b, a), std::strong_ordering::greater);
    EXPECT_EQ(compare(a, a), std::strong_ordering::equal);
}

TEST_F(ConstCompareTest, MismatchedTypesAreABug) {
    EXPECT_THROW(compare(i8_const(1), Const::from_bits(u8_type, 1, 1)), std::logic_error);
}
