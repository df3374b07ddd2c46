#include <ccmatch/conventions.hpp>
#include <ccmatch/errors.hpp>
#include <ccmatch/log.hpp>
#include <algorithm>

namespace ccmatch {

namespace {

std::vector<std::size_t> date_columns(const Table& table, const FieldConventions& conventions,
                                      const std::vector<std::string>& extras) {
    std::vector<std::size_t> found;
    auto consider = [&](const std::string& name) {
        auto index = table.find_column(name);
        if (index && std::find(found.begin(), found.end(), *index) == found.end()) {
            found.push_back(*index);
        }
    };

    for (const auto& name : table.columns()) {
        if (conventions.is_date_field(name)) consider(name);
    }
    for (const auto& name : extras) consider(name);

    std::sort(found.begin(), found.end());
    return found;
}

} // namespace

bool FieldConventions::is_date_field(const std::string& column) const {
    return std::find(date_fields.begin(), date_fields.end(), column) != date_fields.end();
}

std::size_t convert_dates(Table& table, const FieldConventions& conventions,
                          const std::vector<std::string>& extras) {
    auto columns = date_columns(table, conventions, extras);
    if (columns.empty()) return 0;

    CCMATCH_DEBUG("Converting %zu date columns over %zu rows", columns.size(), table.num_rows());

    for (std::size_t column : columns) {
        const std::string& name = table.columns()[column];
        for (std::size_t row = 0; row < table.num_rows(); ++row) {
            Value& cell = table.at(row, column);
            if (cell.is_na() || cell.is_date()) continue;

            if (cell.is_string() && cell.as_string().empty()) {
                cell = Value::na();
                continue;
            }

            auto date = cell.to_date();
            if (!date) {
                throw ConfigurationError("cannot read '" + cell.to_string() + "' in column '" + name +
                                         "' row " + std::to_string(row) + " as a YYYY-MM-DD date",
                                         "date_fields", name);
            }
            cell = *date;
        }
    }
    return columns.size();
}

std::size_t compress_dates(Table& table, const FieldConventions& conventions, const Date& origin) {
    auto columns = date_columns(table, conventions, {});

    for (std::size_t column : columns) {
        for (std::size_t row = 0; row < table.num_rows(); ++row) {
            Value& cell = table.at(row, column);
            if (cell.is_date()) {
                cell = static_cast<std::int64_t>(cell.as_date().days) - origin.days;
            }
        }
    }
    return columns.size();
}

} // namespace ccmatch
