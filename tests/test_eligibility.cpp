#include <gtest/gtest.h>
#include <ccmatch/conventions.hpp>
#include <ccmatch/eligibility.hpp>
#include <ccmatch/errors.hpp>
#include "test_helpers.hpp"

using namespace ccmatch;

class EligibilityTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.match_vars = {"sex", "site"};
        config.index_date_field = "indexdate";

        cases = test_utils::make_table({"patid", "sex", "site", "indexdate"},
                                       {{1, "M", "A", test_utils::date("2020-01-10")},
                                        {2, "M", "A", Value()},
                                        {3, Value(), "A", test_utils::date("2020-01-10")}});
        controls = test_utils::make_table({"patid", "sex", "site", "indexdate"},
                                          {{10, "M", "A", Value()},
                                           {11, "M", "A", test_utils::date("2019-06-01")},
                                           {12, "F", "A", Value()},
                                           {13, "M", "A", test_utils::date("2020-01-10")},
                                           {14, "M", "A", test_utils::date("2020-01-11")},
                                           {1, "M", "A", Value()}});
    }

    ColumnBinding resolve() const {
        return ColumnBinding::resolve(config, conventions, cases, controls);
    }

    MatchConfig config;
    FieldConventions conventions;
    Table cases;
    Table controls;
};

// === COLUMN BINDING ===

TEST_F(EligibilityTest, ResolvesColumnPositions) {
    auto columns = resolve();

    EXPECT_EQ(columns.case_id, 0u);
    EXPECT_EQ(columns.control_id, 0u);
    EXPECT_EQ(columns.case_match, (std::vector<std::size_t>{1, 2}));
    EXPECT_EQ(columns.control_match, (std::vector<std::size_t>{1, 2}));
    ASSERT_TRUE(columns.case_index_date.has_value());
    EXPECT_EQ(*columns.control_index_date, 3u);
}

TEST_F(EligibilityTest, MissingMatchVariableNamesOptionAndColumn) {
    config.match_vars = {"sex", "region"};
    try {
        resolve();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.option(), "match_vars");
        EXPECT_EQ(e.column(), "region");
    }
}

TEST_F(EligibilityTest, MissingExtraVariableOnControlSide) {
    cases.add_column("bmi");
    config.extra_vars = {"bmi"};
    try {
        resolve();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.option(), "extra_vars");
        EXPECT_EQ(e.column(), "bmi");
        EXPECT_NE(std::string(e.what()).find("control pool"), std::string::npos);
    }
}

TEST_F(EligibilityTest, MissingIdentifierColumn) {
    conventions.patient_id = "person_id";
    try {
        resolve();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.option(), "patient_id");
        EXPECT_EQ(e.column(), "person_id");
    }
}

TEST_F(EligibilityTest, IndexDateColumnOnlyRequiredForIncidenceDensity) {
    config.index_date_field = "idx_date";
    EXPECT_THROW(resolve(), ConfigurationError);

    config.method = MatchMethod::Exact;
    auto columns = resolve();
    EXPECT_FALSE(columns.case_index_date.has_value());
    EXPECT_FALSE(columns.control_index_date.has_value());
}

TEST_F(EligibilityTest, ControlDateFieldReadsAnotherColumn) {
    controls.add_column("evt_date");
    config.control_date_field = "evt_date";

    auto columns = resolve();
    EXPECT_EQ(*columns.case_index_date, 3u);
    EXPECT_EQ(*columns.control_index_date, 4u);

    config.control_date_field = "outcome_date";
    try {
        resolve();
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.option(), "control_date_field");
        EXPECT_EQ(e.column(), "outcome_date");
    }
}

// === PREDICATE ===

TEST_F(EligibilityTest, IncidenceDensityPredicate) {
    auto columns = resolve();
    EligibilityPredicate predicate(cases.row(0), columns, nullptr, true);

    ASSERT_TRUE(predicate.index_date().has_value());
    EXPECT_EQ(predicate.index_date()->to_iso(), "2020-01-10");

    EXPECT_TRUE(predicate(controls.row(0)));    // no event date
    EXPECT_FALSE(predicate(controls.row(1)));   // event before index date
    EXPECT_FALSE(predicate(controls.row(2)));   // sex differs
    EXPECT_FALSE(predicate(controls.row(3)));   // event on the index date
    EXPECT_TRUE(predicate(controls.row(4)));    // event the day after
    EXPECT_FALSE(predicate(controls.row(5)));   // the case itself
}

TEST_F(EligibilityTest, CaseWithoutIndexDateHasNoTemporalConstraint) {
    auto columns = resolve();
    EligibilityPredicate predicate(cases.row(1), columns, nullptr, true);

    EXPECT_FALSE(predicate.index_date().has_value());
    EXPECT_TRUE(predicate(controls.row(1)));
    EXPECT_TRUE(predicate(controls.row(3)));
    EXPECT_TRUE(predicate(controls.row(5)));
}

TEST_F(EligibilityTest, ExactMethodIgnoresDates) {
    auto columns = resolve();
    EligibilityPredicate predicate(cases.row(0), columns, nullptr, false);

    EXPECT_TRUE(predicate(controls.row(1)));
    EXPECT_TRUE(predicate(controls.row(3)));
    EXPECT_FALSE(predicate(controls.row(2)));
}

TEST_F(EligibilityTest, NaMatchValueMatchesNothing) {
    auto columns = resolve();
    EligibilityPredicate predicate(cases.row(2), columns, nullptr, false);

    EXPECT_TRUE(predicate.match_key().has_na());
    for (std::size_t row = 0; row < controls.num_rows(); ++row) {
        EXPECT_FALSE(predicate(controls.row(row))) << "control row " << row;
    }
}

TEST_F(EligibilityTest, ExtraConditionIsAppliedLast) {
    auto columns = resolve();
    auto extra = Expression::parse("patid >= 13");
    extra.bind(cases, controls);

    EligibilityPredicate predicate(cases.row(1), columns, &extra, true);

    EXPECT_FALSE(predicate(controls.row(0)));
    EXPECT_TRUE(predicate(controls.row(3)));
    EXPECT_TRUE(predicate(controls.row(4)));
    EXPECT_FALSE(predicate(controls.row(2)));   // condition holds but sex differs
}

TEST_F(EligibilityTest, IsoTextDatesAreAccepted) {
    auto text_cases = test_utils::make_table({"patid", "sex", "site", "indexdate"},
                                             {{1, "M", "A", "2020-01-10"}});
    auto columns = ColumnBinding::resolve(config, conventions, text_cases, controls);
    EligibilityPredicate predicate(text_cases.row(0), columns, nullptr, true);

    ASSERT_TRUE(predicate.index_date().has_value());
    EXPECT_FALSE(predicate(controls.row(3)));
    EXPECT_TRUE(predicate(controls.row(4)));
}

// === MATCH KEYS ===

TEST(MatchKeyTest, EqualityAndHashing) {
    Row a = {Value("M"), Value(1)};
    Row b = {Value("M"), Value(1.0)};
    Row c = {Value("M"), Value()};

    auto ka = MatchKey::from_row(a, {0, 1});
    auto kb = MatchKey::from_row(b, {0, 1});
    auto kc = MatchKey::from_row(c, {0, 1});

    EXPECT_EQ(ka, kb);
    EXPECT_EQ(MatchKeyHash()(ka), MatchKeyHash()(kb));
    EXPECT_TRUE(kc.has_na());
    EXPECT_NE(kc, kc);
}
