#include <ccmatch/match_config.hpp>
#include <ccmatch/errors.hpp>
#include <algorithm>
#include <set>

namespace ccmatch {

const char* method_name(MatchMethod method) {
    switch (method) {
        case MatchMethod::IncidenceDensity: return "incidence_density";
        case MatchMethod::Exact: return "exact";
    }
    return "unknown";
}

MatchMethod parse_method(const std::string& text) {
    if (text == "incidence_density") return MatchMethod::IncidenceDensity;
    if (text == "exact") return MatchMethod::Exact;
    throw ConfigurationError::invalid_option(
        "method", "'" + text + "' is not one of incidence_density, exact");
}

void MatchConfig::validate() const {
    if (n_controls == 0) {
        throw ConfigurationError::invalid_option("n_controls", "must be a positive integer");
    }
    if (cores == 0) {
        throw ConfigurationError::invalid_option("cores", "must be a positive integer");
    }
    if (cases_per_job == 0) {
        throw ConfigurationError::invalid_option("cases_per_job", "must be a positive integer");
    }
    if (match_vars.empty()) {
        throw ConfigurationError::invalid_option("match_vars", "at least one match variable is required");
    }

    std::set<std::string> seen;
    for (const auto& name : match_vars) {
        if (name.empty()) {
            throw ConfigurationError::invalid_option("match_vars", "empty column name");
        }
        if (!seen.insert(name).second) {
            throw ConfigurationError::invalid_option("match_vars", "'" + name + "' listed twice");
        }
    }

    for (const auto& name : extra_vars) {
        if (name.empty()) {
            throw ConfigurationError::invalid_option("extra_vars", "empty column name");
        }
    }

    if (extra_conditions) {
        bool blank = std::all_of(extra_conditions->begin(), extra_conditions->end(),
                                 [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; });
        if (blank) {
            throw ConfigurationError::invalid_option("extra_conditions", "expression is empty");
        }
    }

    if (index_date_field && index_date_field->empty()) {
        throw ConfigurationError::invalid_option("index_date_field", "empty column name");
    }
    if (control_date_field && control_date_field->empty()) {
        throw ConfigurationError::invalid_option("control_date_field", "empty column name");
    }
    if (control_date_field && !index_date_field) {
        throw ConfigurationError::invalid_option("control_date_field", "requires index_date_field");
    }
}

} // namespace ccmatch
