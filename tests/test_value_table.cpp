#include <gtest/gtest.h>
#include <ccmatch/conventions.hpp>
#include <ccmatch/errors.hpp>
#include <ccmatch/table.hpp>
#include <ccmatch/value.hpp>
#include "test_helpers.hpp"

using namespace ccmatch;

// === DATE ===

TEST(DateTest, EpochAndKnownDays) {
    EXPECT_EQ(Date::from_ymd(1970, 1, 1).days, 0);
    EXPECT_EQ(Date::from_ymd(1970, 1, 2).days, 1);
    EXPECT_EQ(Date::from_ymd(1969, 12, 31).days, -1);
    EXPECT_EQ(Date::from_ymd(2000, 3, 1).days - Date::from_ymd(2000, 2, 28).days, 2);
    EXPECT_EQ(Date::from_ymd(1960, 1, 1).days, -3653);
}

TEST(DateTest, ParsesAndFormatsIso) {
    auto d = Date::parse_iso("2020-01-10");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->to_iso(), "2020-01-10");
    EXPECT_EQ(Date::parse_iso("1899-12-31")->to_iso(), "1899-12-31");
    EXPECT_EQ(Date::parse_iso("2024-02-29")->to_iso(), "2024-02-29");
}

TEST(DateTest, RejectsMalformedText) {
    EXPECT_FALSE(Date::parse_iso("2020-1-10").has_value());
    EXPECT_FALSE(Date::parse_iso("2020/01/10").has_value());
    EXPECT_FALSE(Date::parse_iso("2020-13-01").has_value());
    EXPECT_FALSE(Date::parse_iso("2023-02-29").has_value());
    EXPECT_FALSE(Date::parse_iso("abcd-ef-gh").has_value());
    EXPECT_FALSE(Date::parse_iso("").has_value());
}

// === VALUE ===

TEST(ValueTest, NaEqualsNothing) {
    Value na;
    EXPECT_TRUE(na.is_na());
    EXPECT_FALSE(na.equals(na));
    EXPECT_FALSE(na.equals(Value(1)));
    EXPECT_EQ(na, Value::na());  // structural equality still holds
    EXPECT_FALSE(na.compare(Value(1)).has_value());
}

TEST(ValueTest, NumericEqualityAcrossTypes) {
    EXPECT_TRUE(Value(1).equals(Value(1.0)));
    EXPECT_FALSE(Value(1).equals(Value(1.5)));
    EXPECT_NE(Value(1), Value(1.0));
    EXPECT_EQ(Value(1).hash(), Value(1.0).hash());
}

TEST(ValueTest, StringsAndNumbersNeverMatch) {
    EXPECT_FALSE(Value("1").equals(Value(1)));
    EXPECT_FALSE(Value("1").compare(Value(1)).has_value());
}

TEST(ValueTest, DateComparesWithIsoText) {
    Value d = test_utils::date("2020-01-10");
    EXPECT_EQ(d.compare(Value("2020-01-09")), 1);
    EXPECT_EQ(d.compare(Value("2020-01-10")), 0);
    EXPECT_EQ(d.compare(Value("2020-01-11")), -1);
    EXPECT_FALSE(d.compare(Value("not a date")).has_value());
}

TEST(ValueTest, ToDateRejectsDayCountsOutsideDateRange) {
    EXPECT_EQ(Value(std::int64_t(18271)).to_date(), Date::parse_iso("2020-01-10"));
    EXPECT_FALSE(Value(std::int64_t(4294985567)).to_date().has_value());
    EXPECT_FALSE(Value(std::int64_t(-4294967296)).to_date().has_value());

    // The out-of-range count orders against no date at all
    EXPECT_FALSE(Value(std::int64_t(4294967396)).compare(test_utils::date("2020-01-10")).has_value());
}

TEST(ValueTest, ToStringRendering) {
    EXPECT_EQ(Value().to_string(), "NA");
    EXPECT_EQ(Value(42).to_string(), "42");
    EXPECT_EQ(Value("abc").to_string(), "abc");
    EXPECT_EQ(test_utils::date("2019-06-01").to_string(), "2019-06-01");
}

// === TABLE ===

TEST(TableTest, ColumnsAndRows) {
    auto table = test_utils::make_table({"patid", "sex"}, {{1, "M"}, {2, "F"}});

    EXPECT_EQ(table.num_columns(), 2u);
    EXPECT_EQ(table.num_rows(), 2u);
    EXPECT_TRUE(table.has_column("sex"));
    EXPECT_FALSE(table.has_column("site"));
    EXPECT_EQ(table.get(1, "sex"), Value("F"));
}

TEST(TableTest, MissingColumnNamesTheColumn) {
    Table table{"patid"};
    try {
        table.column_index("site");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.column(), "site");
    }
}

TEST(TableTest, RejectsWrongRowWidthAndDuplicateColumns) {
    Table table{"patid", "sex"};
    EXPECT_THROW(table.add_row({1}), ConfigurationError);
    EXPECT_THROW(table.add_column("sex"), ConfigurationError);
}

TEST(TableTest, AddColumnFillsExistingRows) {
    auto table = test_utils::make_table({"patid"}, {{1}, {2}});
    std::size_t index = table.add_column("flag", Value(0));
    EXPECT_EQ(index, 1u);
    EXPECT_EQ(table.at(0, 1), Value(0));
    EXPECT_EQ(table.at(1, 1), Value(0));
}

// === DATE CONVERSION ===

TEST(ConventionsTest, ConvertDatesHandlesTextIntegersAndBlanks) {
    FieldConventions conventions;
    auto table = test_utils::make_table({"patid", "eventdate", "note"},
                                        {{1, "2020-01-10", "2020-01-10"},
                                         {2, 0, "x"},
                                         {3, "", "y"},
                                         {4, Value(), "z"}});

    EXPECT_EQ(convert_dates(table, conventions), 1u);

    EXPECT_EQ(table.at(0, 1), test_utils::date("2020-01-10"));
    EXPECT_EQ(table.at(1, 1), Value(Date(0)));
    EXPECT_TRUE(table.at(2, 1).is_na());
    EXPECT_TRUE(table.at(3, 1).is_na());
    // Not a date field
    EXPECT_TRUE(table.at(0, 2).is_string());
}

TEST(ConventionsTest, ConvertDatesAcceptsExtraColumns) {
    FieldConventions conventions;
    auto table = test_utils::make_table({"patid", "dx_date"}, {{1, "2001-05-06"}});
    convert_dates(table, conventions, {"dx_date"});
    EXPECT_TRUE(table.at(0, 1).is_date());
}

TEST(ConventionsTest, ConvertDatesReportsBadCell) {
    FieldConventions conventions;
    auto table = test_utils::make_table({"patid", "eventdate"}, {{1, "10/01/2020"}});
    try {
        convert_dates(table, conventions);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.column(), "eventdate");
    }

    // A day count that does not fit a Date is unreadable, not wrapped around
    auto out_of_range = test_utils::make_table({"patid", "eventdate"},
                                               {{1, Value(std::int64_t(4294985567))}});
    try {
        convert_dates(out_of_range, conventions);
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.column(), "eventdate");
    }
    EXPECT_TRUE(out_of_range.at(0, 1).is_integer());
}

TEST(ConventionsTest, DateFieldsComeFromConventions) {
    FieldConventions conventions;
    EXPECT_TRUE(conventions.is_date_field("eventdate"));
    EXPECT_TRUE(conventions.is_date_field("indexdate"));
    EXPECT_FALSE(conventions.is_date_field("patid"));

    conventions.date_fields = {"dx_date"};
    auto table = test_utils::make_table({"patid", "eventdate", "dx_date"},
                                        {{1, "2020-01-10", "2021-02-03"}});
    EXPECT_EQ(convert_dates(table, conventions), 1u);
    EXPECT_TRUE(table.at(0, 1).is_string());
    EXPECT_TRUE(table.at(0, 2).is_date());
}

TEST(ConventionsTest, CompressDatesUsesOrigin) {
    FieldConventions conventions;
    auto table = test_utils::make_table({"patid", "eventdate"}, {{1, test_utils::date("1960-01-11")}});
    compress_dates(table, conventions, Date::from_ymd(1960, 1, 1));
    EXPECT_EQ(table.at(0, 1), Value(10));
}
