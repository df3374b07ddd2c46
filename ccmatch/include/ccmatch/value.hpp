#ifndef CCMATCH_VALUE_HPP
#define CCMATCH_VALUE_HPP

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace ccmatch {

/**
 * Calendar day stored as days since 1970-01-01 (proleptic Gregorian).
 */
struct Date {
    std::int32_t days{0};

    Date() = default;
    explicit Date(std::int32_t days_since_epoch) : days(days_since_epoch) {}

    static Date from_ymd(int year, unsigned month, unsigned day);

    // Accepts YYYY-MM-DD; returns nullopt for anything else or an impossible day
    static std::optional<Date> parse_iso(const std::string& text);

    std::string to_iso() const;

    bool operator==(const Date& other) const { return days == other.days; }
    bool operator!=(const Date& other) const { return days != other.days; }
    bool operator<(const Date& other) const { return days < other.days; }
    bool operator<=(const Date& other) const { return days <= other.days; }
    bool operator>(const Date& other) const { return days > other.days; }
    bool operator>=(const Date& other) const { return days >= other.days; }
};

/**
 * A single table cell: NA, integer, real, string or date.
 *
 * Two equality notions exist. operator== is structural (NA == NA, 1 != 1.0)
 * and is what tests and result comparisons use. equals() is the data notion
 * used for matching: integer and real compare numerically and NA equals
 * nothing, itself included.
 */
class Value {
public:
    enum class Type { Null, Integer, Real, String, Date };

private:
    std::variant<std::monostate, std::int64_t, double, std::string, Date> data_;

public:
    Value() = default;
    Value(int v) : data_(static_cast<std::int64_t>(v)) {}
    Value(std::int64_t v) : data_(v) {}
    Value(double v) : data_(v) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(Date v) : data_(v) {}

    static Value na() { return Value(); }

    Type type() const { return static_cast<Type>(data_.index()); }

    bool is_na() const { return type() == Type::Null; }
    bool is_integer() const { return type() == Type::Integer; }
    bool is_real() const { return type() == Type::Real; }
    bool is_numeric() const { return is_integer() || is_real(); }
    bool is_string() const { return type() == Type::String; }
    bool is_date() const { return type() == Type::Date; }

    // Accessors throw std::bad_variant_access on a type mismatch
    std::int64_t as_integer() const { return std::get<std::int64_t>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    Date as_date() const { return std::get<Date>(data_); }

    // Numeric value of an integer or real cell
    double as_real() const {
        return is_integer() ? static_cast<double>(as_integer()) : std::get<double>(data_);
    }

    /**
     * Interpret the cell as a date: a Date, an integer day count or ISO text.
     * NA, anything unparseable and day counts outside the Date range give nullopt.
     */
    std::optional<Date> to_date() const;

    bool equals(const Value& other) const;

    /**
     * Three-way comparison for ordering operators. nullopt when either side
     * is NA or the two types have no common ordering. A string compared
     * with a date is read as an ISO date.
     */
    std::optional<int> compare(const Value& other) const;

    // Consistent with equals(): numerically equal integers and reals hash alike
    std::size_t hash() const;

    // "NA" for null, ISO text for dates
    std::string to_string() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }
};

const char* type_name(Value::Type type);

// Hash-container functors using the matching notion of equality
struct ValueHash {
    std::size_t operator()(const Value& v) const { return v.hash(); }
};

struct ValueEqual {
    bool operator()(const Value& a, const Value& b) const { return a.equals(b); }
};

} // namespace ccmatch

#endif // CCMATCH_VALUE_HPP
