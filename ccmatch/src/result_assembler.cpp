#include <ccmatch/result_assembler.hpp>
#include <ccmatch/errors.hpp>
#include <algorithm>

namespace ccmatch {

ResultAssembler::ResultAssembler(const MatchConfig& config, const FieldConventions& conventions,
                                 const ColumnBinding& columns) {
    std::vector<std::string> reserved = {
        conventions.patient_id,
        conventions.case_id_field,
        conventions.match_id_field,
        conventions.case_indicator_field
    };
    for (std::size_t i = 0; i < reserved.size(); ++i) {
        if (std::find(reserved.begin() + i + 1, reserved.end(), reserved[i]) != reserved.end()) {
            throw ConfigurationError::invalid_option("output columns", "'" + reserved[i] + "' is used twice");
        }
    }

    auto carry = [&](const std::string& name, std::size_t case_column, std::size_t control_column) {
        if (std::find(reserved.begin(), reserved.end(), name) != reserved.end()) {
            throw ConfigurationError::invalid_option(
                "output columns", "'" + name + "' is both a carried variable and a reserved output column");
        }
        for (const auto& existing : carried_) {
            if (existing.name == name) return;
        }
        carried_.push_back({name, case_column, control_column});
    };

    for (std::size_t i = 0; i < config.match_vars.size(); ++i) {
        carry(config.match_vars[i], columns.case_match[i], columns.control_match[i]);
    }
    for (std::size_t i = 0; i < config.extra_vars.size(); ++i) {
        carry(config.extra_vars[i], columns.case_extra[i], columns.control_extra[i]);
    }
    if (columns.case_index_date && columns.control_index_date) {
        carry(*config.index_date_field, *columns.case_index_date, *columns.control_index_date);
    }

    std::vector<std::string> names = reserved;
    for (const auto& column : carried_) {
        names.push_back(column.name);
    }
    table_ = Table(std::move(names));
}

void ResultAssembler::append_row(const Value& own_id, const Row& source, bool is_case,
                                 const Value& case_id, std::size_t match_id) {
    Row row;
    row.reserve(table_.num_columns());

    row.push_back(own_id);
    row.push_back(case_id);
    row.push_back(Value(static_cast<std::int64_t>(match_id)));
    row.push_back(Value(is_case ? 1 : 0));

    for (const auto& column : carried_) {
        row.push_back(source[is_case ? column.case_column : column.control_column]);
    }

    table_.add_row(std::move(row));
}

void ResultAssembler::add(const MatchedSet& set, const Table& cases, const ControlPool& pool) {
    const std::size_t match_id = set.position + 1;

    append_row(set.case_id, cases.row(set.position), true, set.case_id, match_id);

    for (std::size_t control_row : set.control_rows) {
        append_row(pool.id(control_row), pool.row(control_row), false, set.case_id, match_id);
    }
}

} // namespace ccmatch
