#ifndef CCMATCH_CONTROL_POOL_HPP
#define CCMATCH_CONTROL_POOL_HPP

#include <ccmatch/eligibility.hpp>
#include <ccmatch/table.hpp>
#include <unordered_map>
#include <vector>

namespace ccmatch {

/**
 * Candidate controls, indexed by match key.
 *
 * eligible() is const and only reads, so any number of threads may query a
 * pool that nobody is removing from. remove() is for the exact method, whose
 * single worker owns the pool for the whole run.
 */
class ControlPool {
private:
    Table table_;
    std::size_t id_column_;
    std::unordered_map<MatchKey, std::vector<std::size_t>, MatchKeyHash> index_;
    std::unordered_map<Value, std::size_t, ValueHash, ValueEqual> row_by_id_;
    std::vector<char> active_;
    std::size_t active_count_;

public:
    /**
     * Takes ownership of the control table. Identifiers must be present and
     * unique; otherwise ConfigurationError.
     */
    ControlPool(Table table, std::size_t id_column, const std::vector<std::size_t>& match_columns);

    /**
     * Rows still in the pool that satisfy the predicate, in table order.
     * Only rows sharing the predicate's match key are examined.
     */
    std::vector<std::size_t> eligible(const EligibilityPredicate& predicate) const;

    /**
     * Permanently remove controls by identifier. Unknown or already removed
     * identifiers are ignored. Returns how many were removed.
     */
    std::size_t remove(const std::vector<Value>& ids);

    // Same as remove() for rows already located
    std::size_t remove_rows(const std::vector<std::size_t>& rows);

    bool contains(const Value& id) const;
    bool is_active(std::size_t row) const { return active_[row] != 0; }

    const Table& table() const { return table_; }
    const Row& row(std::size_t index) const { return table_.row(index); }
    const Value& id(std::size_t index) const { return table_.at(index, id_column_); }

    std::size_t size() const { return table_.num_rows(); }
    std::size_t active_count() const { return active_count_; }

    // Number of distinct match keys in the index
    std::size_t num_strata() const { return index_.size(); }
};

} // namespace ccmatch

#endif // CCMATCH_CONTROL_POOL_HPP
