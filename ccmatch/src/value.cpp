#include <ccmatch/value.hpp>
#include <cmath>
#include <cstdio>
#include <functional>
#include <limits>

namespace ccmatch {

namespace {

// Days from civil date, after H. Hinnant's chrono algorithms
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool is_leap(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m) {
    static const unsigned lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : lengths[m - 1];
}

bool parse_digits(const std::string& text, std::size_t begin, std::size_t count, int& out) {
    out = 0;
    for (std::size_t i = begin; i < begin + count; ++i) {
        char c = text[i];
        if (c < '0' || c > '9') return false;
        out = out * 10 + (c - '0');
    }
    return true;
}

template<typename T>
int three_way(const T& a, const T& b) {
    return a < b ? -1 : (b < a ? 1 : 0);
}

} // namespace

Date Date::from_ymd(int year, unsigned month, unsigned day) {
    return Date(static_cast<std::int32_t>(days_from_civil(year, month, day)));
}

std::optional<Date> Date::parse_iso(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    int year, month, day;
    if (!parse_digits(text, 0, 4, year) || !parse_digits(text, 5, 2, month) ||
        !parse_digits(text, 8, 2, day)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 ||
        static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }

    return from_ymd(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string Date::to_iso() const {
    std::int64_t y;
    unsigned m, d;
    civil_from_days(days, y, m, d);

    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", static_cast<long long>(y), m, d);
    return buffer;
}

std::optional<Date> Value::to_date() const {
    switch (type()) {
        case Type::Date:
            return as_date();
        case Type::Integer:
            if (as_integer() < std::numeric_limits<std::int32_t>::min() ||
                as_integer() > std::numeric_limits<std::int32_t>::max()) {
                return std::nullopt;
            }
            return Date(static_cast<std::int32_t>(as_integer()));
        case Type::String:
            return Date::parse_iso(as_string());
        default:
            return std::nullopt;
    }
}

bool Value::equals(const Value& other) const {
    if (is_na() || other.is_na()) return false;

    if (is_numeric() && other.is_numeric()) {
        if (is_integer() && other.is_integer()) {
            return as_integer() == other.as_integer();
        }
        return as_real() == other.as_real();
    }

    return data_ == other.data_;
}

std::optional<int> Value::compare(const Value& other) const {
    if (is_na() || other.is_na()) return std::nullopt;

    if (is_numeric() && other.is_numeric()) {
        if (is_integer() && other.is_integer()) {
            return three_way(as_integer(), other.as_integer());
        }
        double a = as_real();
        double b = other.as_real();
        if (std::isnan(a) || std::isnan(b)) return std::nullopt;
        return three_way(a, b);
    }

    if (is_string() && other.is_string()) {
        return three_way(as_string(), other.as_string());
    }

    if (is_date() || other.is_date()) {
        auto a = to_date();
        auto b = other.to_date();
        if (!a || !b) return std::nullopt;
        return three_way(a->days, b->days);
    }

    return std::nullopt;
}

std::size_t Value::hash() const {
    switch (type()) {
        case Type::Null:
            return 0;
        case Type::Integer:
            return std::hash<double>()(static_cast<double>(as_integer()));
        case Type::Real:
            return std::hash<double>()(as_real());
        case Type::String:
            return std::hash<std::string>()(as_string());
        case Type::Date:
            return std::hash<std::int32_t>()(as_date().days) ^ 0x9e3779b97f4a7c15ULL;
    }
    return 0;
}

std::string Value::to_string() const {
    switch (type()) {
        case Type::Null:
            return "NA";
        case Type::Integer:
            return std::to_string(as_integer());
        case Type::Real: {
            char buffer[64];
            snprintf(buffer, sizeof(buffer), "%g", as_real());
            return buffer;
        }
        case Type::String:
            return as_string();
        case Type::Date:
            return as_date().to_iso();
    }
    return "";
}

const char* type_name(Value::Type type) {
    switch (type) {
        case Value::Type::Null: return "NA";
        case Value::Type::Integer: return "integer";
        case Value::Type::Real: return "real";
        case Value::Type::String: return "string";
        case Value::Type::Date: return "date";
    }
    return "unknown";
}

} // namespace ccmatch
