#ifndef CCMATCH_CASE_MATCHER_HPP
#define CCMATCH_CASE_MATCHER_HPP

#include <ccmatch/control_pool.hpp>
#include <ccmatch/eligibility.hpp>
#include <ccmatch/expression.hpp>
#include <ccmatch/match_config.hpp>
#include <ccmatch/table.hpp>
#include <cstdint>
#include <memory>
#include <vector>

namespace ccmatch {

/**
 * One case and the controls drawn for it.
 */
struct MatchedSet {
    std::size_t position = 0;                // Case row in the cases table
    Value case_id;
    std::vector<std::size_t> control_rows;   // Rows of the control pool table
    std::size_t requested = 0;
    std::size_t eligible = 0;                // Candidates available when sampled

    std::size_t shortfall() const {
        return requested > control_rows.size() ? requested - control_rows.size() : 0;
    }
};

/**
 * Read-only inputs shared by every case of a run.
 */
struct MatchContext {
    const Table* cases = nullptr;
    const ColumnBinding* columns = nullptr;
    const Expression* extra_conditions = nullptr;
    std::size_t n_controls = 1;
    std::uint64_t seed = 0;
};

/**
 * Per-case matching step: build the predicate, query the pool, sample.
 * The two implementations differ in how they treat the pool.
 */
class CaseMatcher {
public:
    virtual ~CaseMatcher() = default;

    virtual MatchedSet match_case(std::size_t position) = 0;

    /**
     * Largest number of threads that may call match_case() at once.
     * Implementations returning more than one must be safe for concurrent
     * calls on distinct positions.
     */
    virtual std::size_t max_workers() const = 0;

    virtual MatchMethod method() const = 0;
};

/**
 * Exact matching: controls leave the pool once assigned. Cases must be
 * processed one at a time in input order.
 */
class ExactCaseMatcher : public CaseMatcher {
private:
    MatchContext context_;
    ControlPool& pool_;

public:
    ExactCaseMatcher(const MatchContext& context, ControlPool& pool)
        : context_(context), pool_(pool) {}

    MatchedSet match_case(std::size_t position) override;

    std::size_t max_workers() const override { return 1; }
    MatchMethod method() const override { return MatchMethod::Exact; }
};

/**
 * Incidence density sampling: the pool never changes during the run, so
 * cases are independent and may run on any number of workers.
 */
class IncidenceDensityCaseMatcher : public CaseMatcher {
private:
    MatchContext context_;
    const ControlPool& pool_;

public:
    IncidenceDensityCaseMatcher(const MatchContext& context, const ControlPool& pool)
        : context_(context), pool_(pool) {}

    MatchedSet match_case(std::size_t position) override;

    std::size_t max_workers() const override;
    MatchMethod method() const override { return MatchMethod::IncidenceDensity; }
};

std::unique_ptr<CaseMatcher> make_case_matcher(MatchMethod method, const MatchContext& context,
                                               ControlPool& pool);

} // namespace ccmatch

#endif // CCMATCH_CASE_MATCHER_HPP
