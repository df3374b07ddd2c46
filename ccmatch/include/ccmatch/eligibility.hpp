#ifndef CCMATCH_ELIGIBILITY_HPP
#define CCMATCH_ELIGIBILITY_HPP

#include <ccmatch/conventions.hpp>
#include <ccmatch/expression.hpp>
#include <ccmatch/match_config.hpp>
#include <ccmatch/table.hpp>
#include <optional>
#include <vector>

namespace ccmatch {

/**
 * Values of the match variables for one row.
 * Keys compare with Value::equals, so a key holding NA equals no key at all;
 * such keys are never stored in an index.
 */
struct MatchKey {
    std::vector<Value> values;

    bool has_na() const;

    bool operator==(const MatchKey& other) const;
    bool operator!=(const MatchKey& other) const { return !(*this == other); }

    static MatchKey from_row(const Row& row, const std::vector<std::size_t>& columns);
};

struct MatchKeyHash {
    std::size_t operator()(const MatchKey& key) const;
};

/**
 * Column positions of every configured variable in both input tables,
 * resolved once before the run.
 */
struct ColumnBinding {
    std::size_t case_id = 0;
    std::size_t control_id = 0;
    std::vector<std::size_t> case_match;
    std::vector<std::size_t> control_match;
    std::vector<std::size_t> case_extra;
    std::vector<std::size_t> control_extra;
    std::optional<std::size_t> case_index_date;
    std::optional<std::size_t> control_index_date;

    /**
     * Throws ConfigurationError naming the option and column when a match,
     * extra, identifier or index-date column is absent from either table.
     * The index-date column is only required when config.uses_index_date().
     */
    static ColumnBinding resolve(const MatchConfig& config, const FieldConventions& conventions,
                                 const Table& cases, const Table& controls);
};

/**
 * Per-case eligibility test for candidate controls.
 *
 * A candidate is eligible iff
 *  - every match variable equals the case's value exactly,
 *  - it is not the case itself (same identifier),
 *  - the extra condition, if any, holds for the (case, candidate) pair,
 *  - under incidence-density sampling with a known case index date, the
 *    candidate is still at risk: its own date is NA or strictly later.
 */
class EligibilityPredicate {
private:
    const Row* case_row_;
    const ColumnBinding* columns_;
    const Expression* extra_;
    MatchKey key_;
    std::optional<Date> index_date_;

public:
    /**
     * @param extra bound extra_conditions expression, or nullptr
     * @param apply_index_date whether the at-risk test applies (incidence density)
     */
    EligibilityPredicate(const Row& case_row, const ColumnBinding& columns,
                         const Expression* extra, bool apply_index_date);

    bool operator()(const Row& candidate) const;

    bool matches_key(const Row& candidate) const;
    bool at_risk(const Row& candidate) const;

    const MatchKey& match_key() const { return key_; }
    const Value& case_id() const { return (*case_row_)[columns_->case_id]; }

    // Index date in force for this case, if the at-risk test applies
    const std::optional<Date>& index_date() const { return index_date_; }
};

} // namespace ccmatch

#endif // CCMATCH_ELIGIBILITY_HPP
