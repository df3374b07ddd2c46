#include <ccmatch/control_pool.hpp>
#include <ccmatch/errors.hpp>
#include <ccmatch/log.hpp>
#include <utility>

namespace ccmatch {

ControlPool::ControlPool(Table table, std::size_t id_column, const std::vector<std::size_t>& match_columns)
    : table_(std::move(table))
    , id_column_(id_column)
    , active_(table_.num_rows(), 1)
    , active_count_(table_.num_rows()) {
    const std::string& id_name = table_.columns()[id_column_];
    row_by_id_.reserve(table_.num_rows());

    for (std::size_t row = 0; row < table_.num_rows(); ++row) {
        const Value& id = table_.at(row, id_column_);
        if (id.is_na()) {
            throw ConfigurationError("control pool row " + std::to_string(row) + " has no identifier",
                                     "patient_id", id_name);
        }
        if (!row_by_id_.emplace(id, row).second) {
            throw ConfigurationError("control pool identifier " + id.to_string() + " appears more than once",
                                     "patient_id", id_name);
        }

        MatchKey key = MatchKey::from_row(table_.row(row), match_columns);
        if (!key.has_na()) {
            index_[std::move(key)].push_back(row);
        }
    }

    CCMATCH_DEBUG("Control pool: %zu controls in %zu strata", table_.num_rows(), index_.size());
}

std::vector<std::size_t> ControlPool::eligible(const EligibilityPredicate& predicate) const {
    std::vector<std::size_t> result;

    const MatchKey& key = predicate.match_key();
    if (key.has_na()) return result;

    auto it = index_.find(key);
    if (it == index_.end()) return result;

    for (std::size_t row : it->second) {
        if (active_[row] && predicate(table_.row(row))) {
            result.push_back(row);
        }
    }
    return result;
}

std::size_t ControlPool::remove(const std::vector<Value>& ids) {
    std::vector<std::size_t> rows;
    rows.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = row_by_id_.find(id);
        if (it != row_by_id_.end()) {
            rows.push_back(it->second);
        }
    }
    return remove_rows(rows);
}

std::size_t ControlPool::remove_rows(const std::vector<std::size_t>& rows) {
    std::size_t removed = 0;
    for (std::size_t row : rows) {
        if (row < active_.size() && active_[row]) {
            active_[row] = 0;
            ++removed;
        }
    }
    active_count_ -= removed;
    return removed;
}

bool ControlPool::contains(const Value& id) const {
    auto it = row_by_id_.find(id);
    return it != row_by_id_.end() && active_[it->second];
}

} // namespace ccmatch
