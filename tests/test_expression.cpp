#include <gtest/gtest.h>
#include <ccmatch/errors.hpp>
#include <ccmatch/expression.hpp>
#include "test_helpers.hpp"
#include <cstdint>
#include <limits>

using namespace ccmatch;

class ExpressionTest : public ::testing::Test {
protected:
    void SetUp() override {
        cases = test_utils::make_table({"patid", "yob", "indexdate", "practice"},
                                       {{1, 1950, test_utils::date("2010-05-01"), "P1"}});
        controls = test_utils::make_table({"patid", "yob", "eventdate", "practice", "bmi"},
                                          {{10, 1952, test_utils::date("2011-01-01"), "P1", 24.5},
                                           {11, 1960, Value(), "P2", Value()}});
    }

    Expression bound(const std::string& source) {
        Expression e = Expression::parse(source);
        e.bind(cases, controls);
        return e;
    }

    const Row& case_row() const { return cases.row(0); }
    const Row& near_control() const { return controls.row(0); }
    const Row& far_control() const { return controls.row(1); }

    Table cases;
    Table controls;
};

// === PARSING ===

TEST_F(ExpressionTest, PrecedenceFollowsArithmeticRules) {
    auto e = Expression::parse("yob + 2 * 3 > case.yob");
    EXPECT_EQ(e.to_string(), "((control.yob + (2 * 3)) > case.yob)");

    auto logic = Expression::parse("a == 1 | b == 2 & !c");
    EXPECT_EQ(logic.to_string(), "((control.a == 1) | ((control.b == 2) & (!control.c)))");
}

TEST_F(ExpressionTest, WordOperatorsAndDoubledSymbolsAreAliases) {
    auto words = Expression::parse("not a and b or c");
    auto symbols = Expression::parse("!a && b || c");
    EXPECT_EQ(words.to_string(), symbols.to_string());
}

TEST_F(ExpressionTest, ReferencedFieldsAreDistinctAndOrdered) {
    auto e = Expression::parse("abs_diff == 0 | case.yob - yob <= 5 & case.yob > 0");
    const auto& fields = e.referenced_fields();

    ASSERT_EQ(fields.size(), 3u);
    EXPECT_EQ(fields[0], (FieldRef{FieldScope::Control, "abs_diff"}));
    EXPECT_EQ(fields[1], (FieldRef{FieldScope::Case, "yob"}));
    EXPECT_EQ(fields[2], (FieldRef{FieldScope::Control, "yob"}));
}

TEST_F(ExpressionTest, SyntaxErrorsCarryPosition) {
    const char* broken[] = {
        "yob ==",
        "(yob > 1",
        "yob < 1 < 2",
        "'unterminated",
        "yob %like% 3",
        "mean(yob) > 0",
        "yob in c(1, yob)",
        "yob # 2",
        "case. == 1",
        ""
    };
    for (const char* source : broken) {
        EXPECT_THROW(Expression::parse(source), ExpressionError) << source;
    }

    try {
        Expression::parse("yob > > 1");
        FAIL() << "expected ExpressionError";
    } catch (const ExpressionError& e) {
        EXPECT_EQ(e.position(), 6u);
        EXPECT_EQ(e.option(), "extra_conditions");
    }
}

// === BINDING ===

TEST_F(ExpressionTest, BindRejectsUnknownColumns) {
    auto e = Expression::parse("case.bmi > 20");
    try {
        e.bind(cases, controls);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& error) {
        EXPECT_EQ(error.option(), "extra_conditions");
        EXPECT_EQ(error.column(), "bmi");
    }
    EXPECT_FALSE(e.is_bound());
}

TEST_F(ExpressionTest, EvaluateBeforeBindIsALogicError) {
    auto e = Expression::parse("yob > 0");
    EXPECT_THROW(e.evaluate(case_row(), near_control()), std::logic_error);
}

// === EVALUATION ===

TEST_F(ExpressionTest, CaseAndControlFieldsReadTheirOwnRows) {
    auto e = bound("case.yob - yob");
    EXPECT_EQ(e.evaluate(case_row(), near_control()), Value(-2));
    EXPECT_EQ(e.evaluate(case_row(), far_control()), Value(-10));

    auto within = bound("yob - case.yob <= 5 & practice == case.practice");
    EXPECT_TRUE(within.test(case_row(), near_control()));
    EXPECT_FALSE(within.test(case_row(), far_control()));
}

TEST_F(ExpressionTest, ComparisonWithNaIsNotMet) {
    auto e = bound("bmi > 20");
    EXPECT_TRUE(e.test(case_row(), near_control()));
    EXPECT_TRUE(e.evaluate(case_row(), far_control()).is_na());
    EXPECT_FALSE(e.test(case_row(), far_control()));

    auto negated = bound("!(bmi > 20)");
    EXPECT_FALSE(negated.test(case_row(), far_control()));
}

TEST_F(ExpressionTest, ThreeValuedLogic) {
    EXPECT_EQ(bound("bmi > 20 | TRUE").evaluate(case_row(), far_control()), Value(1));
    EXPECT_EQ(bound("bmi > 20 & FALSE").evaluate(case_row(), far_control()), Value(0));
    EXPECT_TRUE(bound("bmi > 20 & TRUE").evaluate(case_row(), far_control()).is_na());
    EXPECT_TRUE(bound("bmi > 20 | FALSE").evaluate(case_row(), far_control()).is_na());
}

TEST_F(ExpressionTest, IsNaAndMembership) {
    EXPECT_TRUE(bound("is_na(eventdate)").test(case_row(), far_control()));
    EXPECT_FALSE(bound("is.na(eventdate)").test(case_row(), near_control()));

    auto member = bound("practice %in% c('P1', 'P3')");
    EXPECT_TRUE(member.test(case_row(), near_control()));
    EXPECT_FALSE(member.test(case_row(), far_control()));

    auto numbers = bound("yob in (1950, 1952L, -1)");
    EXPECT_TRUE(numbers.test(case_row(), near_control()));
    EXPECT_FALSE(numbers.test(case_row(), far_control()));
}

TEST_F(ExpressionTest, DatesCompareWithDatesAndIsoText) {
    auto later = bound("eventdate > case.indexdate");
    EXPECT_TRUE(later.test(case_row(), near_control()));
    EXPECT_FALSE(later.test(case_row(), far_control()));

    auto literal = bound("eventdate >= '2011-01-01'");
    EXPECT_TRUE(literal.test(case_row(), near_control()));

    auto gap = bound("eventdate - case.indexdate");
    EXPECT_EQ(gap.evaluate(case_row(), near_control()), Value(245));

    auto shifted = bound("case.indexdate + 30 < eventdate");
    EXPECT_TRUE(shifted.test(case_row(), near_control()));
}

TEST_F(ExpressionTest, DivisionByZeroIsNa) {
    auto e = bound("yob / 0");
    EXPECT_TRUE(e.evaluate(case_row(), near_control()).is_na());
    EXPECT_EQ(bound("yob / 4").evaluate(case_row(), near_control()), Value(488.0));
}

TEST(ExpressionOverflowTest, IntegerOverflowIsNa) {
    const std::int64_t max = std::numeric_limits<std::int64_t>::max();
    const std::int64_t min = std::numeric_limits<std::int64_t>::min();
    auto cases = test_utils::make_table({"patid", "big"}, {{1, Value(max)}});
    auto controls = test_utils::make_table({"patid", "big"}, {{10, 1}, {11, Value(min)}});

    auto sum = Expression::parse("case.big + big > 0");
    sum.bind(cases, controls);
    EXPECT_TRUE(sum.evaluate(cases.row(0), controls.row(0)).is_na());
    EXPECT_FALSE(sum.test(cases.row(0), controls.row(0)));

    auto difference = Expression::parse("big - case.big");
    difference.bind(cases, controls);
    EXPECT_TRUE(difference.evaluate(cases.row(0), controls.row(1)).is_na());

    auto product = Expression::parse("case.big * 2");
    product.bind(cases, controls);
    EXPECT_TRUE(product.evaluate(cases.row(0), controls.row(0)).is_na());

    auto negated = Expression::parse("-big");
    negated.bind(cases, controls);
    EXPECT_TRUE(negated.evaluate(cases.row(0), controls.row(1)).is_na());
    EXPECT_EQ(negated.evaluate(cases.row(0), controls.row(0)), Value(-1));

    // In-range arithmetic is unaffected
    auto in_range = Expression::parse("case.big - big");
    in_range.bind(cases, controls);
    EXPECT_EQ(in_range.evaluate(cases.row(0), controls.row(0)), Value(max - 1));
}

TEST_F(ExpressionTest, DateShiftOutsideDateRangeIsNa) {
    auto e = bound("case.indexdate + 1e12");
    EXPECT_TRUE(e.evaluate(case_row(), near_control()).is_na());

    auto wrapped = bound("case.indexdate - 4294967296");
    EXPECT_TRUE(wrapped.evaluate(case_row(), near_control()).is_na());
}

TEST_F(ExpressionTest, TypeErrorsSurfaceAtEvaluation) {
    auto e = bound("practice + 1");
    EXPECT_THROW(e.evaluate(case_row(), near_control()), std::runtime_error);

    // Comparing a string with a number is NA rather than an error
    EXPECT_FALSE(bound("practice > 1").test(case_row(), near_control()));
}
