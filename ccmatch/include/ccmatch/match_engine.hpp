#ifndef CCMATCH_MATCH_ENGINE_HPP
#define CCMATCH_MATCH_ENGINE_HPP

#include <ccmatch/case_matcher.hpp>
#include <ccmatch/conventions.hpp>
#include <ccmatch/match_config.hpp>
#include <ccmatch/table.hpp>
#include <string>
#include <vector>

namespace ccmatch {

/**
 * Job types submitted to the worker pool.
 */
enum class MatchJobType {
    MATCH_CASES   // A contiguous block of case positions
};

/**
 * A case that received fewer controls than requested.
 */
struct Shortfall {
    std::size_t position;
    Value case_id;
    std::size_t requested;
    std::size_t found;

    std::size_t missing() const { return requested - found; }
};

struct MatchResult {
    Table table;
    std::vector<MatchedSet> sets;          // One per case, in case input order
    std::vector<Shortfall> shortfalls;     // In case input order
    std::vector<std::string> notices;
    std::size_t workers_used = 1;

    // Shortfall recorded for a case identifier, or nullptr
    const Shortfall* find_shortfall(const Value& case_id) const;

    std::size_t total_controls() const;
};

/**
 * Assigns matched controls to cases.
 *
 * Per run: validate the configuration against both tables, pick the per-case
 * matcher for the method, process every case (sequentially for exact
 * matching, on a worker pool for incidence density sampling), then assemble
 * the matched-set table in case input order.
 *
 * The engine keeps no state between runs; one engine may serve several runs,
 * including concurrent ones.
 */
class MatchEngine {
private:
    MatchConfig config_;
    FieldConventions conventions_;

public:
    explicit MatchEngine(MatchConfig config, FieldConventions conventions = FieldConventions());

    /**
     * Throws ConfigurationError before any case is processed when the
     * configuration does not fit the tables, and TaskFailure when a case
     * fails mid-run. No partial result is returned in either case.
     */
    MatchResult get_matches(const Table& cases, const Table& control_pool) const;

    const MatchConfig& config() const { return config_; }
    const FieldConventions& conventions() const { return conventions_; }
};

MatchResult get_matches(const Table& cases, const Table& control_pool, const MatchConfig& config,
                        const FieldConventions& conventions = FieldConventions());

} // namespace ccmatch

#endif // CCMATCH_MATCH_ENGINE_HPP
