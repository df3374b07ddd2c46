#include <ccmatch/eligibility.hpp>
#include <ccmatch/errors.hpp>

namespace ccmatch {

namespace {

std::size_t require_column(const Table& table, const std::string& column,
                           const std::string& option, const char* table_name) {
    auto index = table.find_column(column);
    if (!index) {
        throw ConfigurationError::missing_column(option, column, table_name);
    }
    return *index;
}

void resolve_pair(const Table& cases, const Table& controls, const std::string& column,
                  const std::string& option,
                  std::vector<std::size_t>& case_out, std::vector<std::size_t>& control_out) {
    case_out.push_back(require_column(cases, column, option, "cases"));
    control_out.push_back(require_column(controls, column, option, "control pool"));
}

} // namespace

bool MatchKey::has_na() const {
    for (const auto& v : values) {
        if (v.is_na()) return true;
    }
    return false;
}

bool MatchKey::operator==(const MatchKey& other) const {
    if (values.size() != other.values.size()) return false;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!values[i].equals(other.values[i])) return false;
    }
    return true;
}

MatchKey MatchKey::from_row(const Row& row, const std::vector<std::size_t>& columns) {
    MatchKey key;
    key.values.reserve(columns.size());
    for (std::size_t column : columns) {
        key.values.push_back(row[column]);
    }
    return key;
}

std::size_t MatchKeyHash::operator()(const MatchKey& key) const {
    std::size_t seed = key.values.size();
    for (const auto& v : key.values) {
        seed ^= v.hash() + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
}

ColumnBinding ColumnBinding::resolve(const MatchConfig& config, const FieldConventions& conventions,
                                     const Table& cases, const Table& controls) {
    ColumnBinding binding;

    binding.case_id = require_column(cases, conventions.patient_id, "patient_id", "cases");
    binding.control_id = require_column(controls, conventions.patient_id, "patient_id", "control pool");

    for (const auto& name : config.match_vars) {
        resolve_pair(cases, controls, name, "match_vars", binding.case_match, binding.control_match);
    }
    for (const auto& name : config.extra_vars) {
        resolve_pair(cases, controls, name, "extra_vars", binding.case_extra, binding.control_extra);
    }

    if (config.uses_index_date()) {
        binding.case_index_date = require_column(cases, *config.index_date_field, "index_date_field", "cases");
        binding.control_index_date = require_column(controls, config.control_date_column(),
                                                    config.control_date_field ? "control_date_field"
                                                                              : "index_date_field",
                                                    "control pool");
    }

    return binding;
}

EligibilityPredicate::EligibilityPredicate(const Row& case_row, const ColumnBinding& columns,
                                           const Expression* extra, bool apply_index_date)
    : case_row_(&case_row)
    , columns_(&columns)
    , extra_(extra)
    , key_(MatchKey::from_row(case_row, columns.case_match)) {
    if (apply_index_date && columns.case_index_date && columns.control_index_date) {
        index_date_ = case_row[*columns.case_index_date].to_date();
    }
}

bool EligibilityPredicate::matches_key(const Row& candidate) const {
    for (std::size_t i = 0; i < columns_->control_match.size(); ++i) {
        if (!key_.values[i].equals(candidate[columns_->control_match[i]])) {
            return false;
        }
    }
    return true;
}

bool EligibilityPredicate::at_risk(const Row& candidate) const {
    if (!index_date_) return true;

    const Value& event = candidate[*columns_->control_index_date];
    if (event.is_na()) return true;

    auto event_date = event.to_date();
    return event_date && *event_date > *index_date_;
}

bool EligibilityPredicate::operator()(const Row& candidate) const {
    if (!matches_key(candidate)) return false;

    // A subject is never its own control
    if (case_id().equals(candidate[columns_->control_id])) return false;

    if (!at_risk(candidate)) return false;

    return extra_ == nullptr || extra_->test(*case_row_, candidate);
}

} // namespace ccmatch
