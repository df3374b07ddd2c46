#ifndef CCMATCH_RESULT_ASSEMBLER_HPP
#define CCMATCH_RESULT_ASSEMBLER_HPP

#include <ccmatch/case_matcher.hpp>
#include <ccmatch/control_pool.hpp>
#include <ccmatch/conventions.hpp>
#include <ccmatch/match_config.hpp>
#include <ccmatch/table.hpp>
#include <string>
#include <utility>
#include <vector>

namespace ccmatch {

/**
 * Builds the matched-set table: one row per case followed by one row per
 * control drawn for it.
 *
 * Columns, in order: the patient identifier, the case identifier, the matched
 * set number (1-based, in case input order), the case indicator (1 for the
 * case row, 0 for controls), the match variables, the extra variables and,
 * when incidence-density dates apply, the index-date column. A column named
 * more than once is emitted once.
 */
class ResultAssembler {
private:
    struct OutputColumn {
        std::string name;
        std::size_t case_column;
        std::size_t control_column;
    };

    std::vector<OutputColumn> carried_;
    Table table_;

    void append_row(const Value& own_id, const Row& source, bool is_case,
                    const Value& case_id, std::size_t match_id);

public:
    ResultAssembler(const MatchConfig& config, const FieldConventions& conventions,
                    const ColumnBinding& columns);

    void add(const MatchedSet& set, const Table& cases, const ControlPool& pool);

    const Table& table() const { return table_; }

    Table finish() { return std::move(table_); }
};

} // namespace ccmatch

#endif // CCMATCH_RESULT_ASSEMBLER_HPP
