#ifndef CCMATCH_MATCH_CONFIG_HPP
#define CCMATCH_MATCH_CONFIG_HPP

#include <ccmatch/value.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ccmatch {

/**
 * Consistency discipline for the control pool.
 */
enum class MatchMethod {
    IncidenceDensity,  // Immutable pool; a control may serve several cases
    Exact              // Assigned controls leave the pool; strictly sequential
};

const char* method_name(MatchMethod method);

// Accepts "incidence_density" or "exact"; anything else is a ConfigurationError
MatchMethod parse_method(const std::string& text);

/**
 * Invoked once per processed case with its input position and identifier.
 * Under parallel execution calls arrive from worker threads in no fixed order.
 */
using ProgressTracker = std::function<void(std::size_t position, const Value& case_id)>;

struct MatchConfig {
    std::size_t n_controls = 1;
    std::vector<std::string> match_vars;
    std::vector<std::string> extra_vars;
    std::optional<std::string> extra_conditions;
    MatchMethod method = MatchMethod::IncidenceDensity;
    std::optional<std::string> index_date_field;
    // Control column holding each control's own event date; defaults to index_date_field
    std::optional<std::string> control_date_field;
    std::size_t cores = 1;
    std::size_t cases_per_job = 10;
    std::uint64_t seed = 0;
    bool track = false;
    ProgressTracker tracker;

    /**
     * Option-level checks that need no table: n_controls, cores and
     * cases_per_job positive, match_vars non-empty and free of duplicates,
     * extra_conditions not blank. Throws ConfigurationError.
     */
    void validate() const;

    // True when incidence-density sampling applies an at-risk date test
    bool uses_index_date() const {
        return method == MatchMethod::IncidenceDensity && index_date_field.has_value();
    }

    const std::string& control_date_column() const {
        return control_date_field ? *control_date_field : *index_date_field;
    }
};

} // namespace ccmatch

#endif // CCMATCH_MATCH_CONFIG_HPP
