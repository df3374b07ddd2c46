#include <ccmatch/match_engine.hpp>
#include <ccmatch/control_pool.hpp>
#include <ccmatch/eligibility.hpp>
#include <ccmatch/errors.hpp>
#include <ccmatch/expression.hpp>
#include <ccmatch/log.hpp>
#include <ccmatch/progress.hpp>
#include <ccmatch/result_assembler.hpp>
#include <job_system/job_system.hpp>
#include <algorithm>
#include <iostream>
#include <optional>
#include <unordered_set>

namespace ccmatch {

namespace {

void check_case_ids(const Table& cases, std::size_t id_column) {
    std::unordered_set<Value, ValueHash, ValueEqual> seen;
    seen.reserve(cases.num_rows());

    const std::string& name = cases.columns()[id_column];
    for (std::size_t row = 0; row < cases.num_rows(); ++row) {
        const Value& id = cases.at(row, id_column);
        if (id.is_na()) {
            throw ConfigurationError("case at position " + std::to_string(row) + " has no identifier",
                                     "patient_id", name);
        }
        if (!seen.insert(id).second) {
            throw ConfigurationError("case identifier " + id.to_string() + " appears more than once",
                                     "patient_id", name, id.to_string());
        }
    }
}

std::size_t plan_workers(const MatchConfig& config, const CaseMatcher& matcher, std::size_t num_cases) {
    std::size_t jobs = (num_cases + config.cases_per_job - 1) / config.cases_per_job;
    std::size_t workers = std::min(config.cores, matcher.max_workers());
    return std::max<std::size_t>(1, std::min(workers, jobs));
}

} // namespace

const Shortfall* MatchResult::find_shortfall(const Value& case_id) const {
    for (const auto& shortfall : shortfalls) {
        if (shortfall.case_id.equals(case_id)) return &shortfall;
    }
    return nullptr;
}

std::size_t MatchResult::total_controls() const {
    std::size_t total = 0;
    for (const auto& set : sets) {
        total += set.control_rows.size();
    }
    return total;
}

MatchEngine::MatchEngine(MatchConfig config, FieldConventions conventions)
    : config_(std::move(config))
    , conventions_(std::move(conventions)) {}

MatchResult MatchEngine::get_matches(const Table& cases, const Table& control_pool) const {
    config_.validate();

    MatchResult result;

    // === VALIDATION: nothing below may fail once cases start running ===

    Table case_table = cases;
    Table pool_table = control_pool;

    ColumnBinding columns = ColumnBinding::resolve(config_, conventions_, case_table, pool_table);
    check_case_ids(case_table, columns.case_id);

    if (config_.uses_index_date()) {
        FieldConventions index_only = conventions_;
        index_only.date_fields = {*config_.index_date_field};
        convert_dates(case_table, index_only);
        index_only.date_fields = {config_.control_date_column()};
        convert_dates(pool_table, index_only);
    }

    std::optional<Expression> extra;
    if (config_.extra_conditions) {
        extra = Expression::parse(*config_.extra_conditions);
        extra->bind(case_table, pool_table);
    }

    if (config_.method == MatchMethod::Exact && config_.cores > 1) {
        result.notices.push_back("exact matching runs on a single worker; cores = " +
                                 std::to_string(config_.cores) + " ignored");
        CCMATCH_NOTICE("%s", result.notices.back().c_str());
    }
    if (config_.method == MatchMethod::Exact && config_.index_date_field) {
        result.notices.push_back("index_date_field '" + *config_.index_date_field +
                                 "' only applies to incidence_density matching; ignored");
        CCMATCH_NOTICE("%s", result.notices.back().c_str());
    }

    ResultAssembler assembler(config_, conventions_, columns);
    ControlPool pool(std::move(pool_table), columns.control_id, columns.control_match);

    MatchContext context;
    context.cases = &case_table;
    context.columns = &columns;
    context.extra_conditions = extra ? &*extra : nullptr;
    context.n_controls = config_.n_controls;
    context.seed = config_.seed;

    std::unique_ptr<CaseMatcher> matcher = make_case_matcher(config_.method, context, pool);

    ProgressTracker tracker;
    if (config_.track) {
        tracker = config_.tracker ? config_.tracker : make_dot_tracker(std::cerr);
    }

    // === MATCHING ===

    const std::size_t num_cases = case_table.num_rows();
    std::vector<MatchedSet> sets(num_cases);
    result.workers_used = plan_workers(config_, *matcher, num_cases);

    CCMATCH_DEBUG("Matching %zu cases against %zu controls (%s, %zu workers)",
                  num_cases, pool.size(), method_name(matcher->method()), result.workers_used);

    // Each position is written by exactly one job
    auto run_case = [&](std::size_t position) {
        try {
            sets[position] = matcher->match_case(position);
            if (tracker) tracker(position, sets[position].case_id);
        } catch (const std::exception& e) {
            throw TaskFailure(position, case_table.at(position, columns.case_id).to_string(), e.what());
        } catch (...) {
            throw TaskFailure(position, case_table.at(position, columns.case_id).to_string(),
                              "unknown exception");
        }
    };

    if (result.workers_used == 1) {
        for (std::size_t position = 0; position < num_cases; ++position) {
            run_case(position);
        }
    } else {
        job_system::JobSystem<MatchJobType> jobs(result.workers_used);
        jobs.start();

        for (std::size_t begin = 0; begin < num_cases; begin += config_.cases_per_job) {
            std::size_t end = std::min(num_cases, begin + config_.cases_per_job);
            jobs.submit_function([&run_case, begin, end]() {
                for (std::size_t position = begin; position < end; ++position) {
                    run_case(position);
                }
            }, MatchJobType::MATCH_CASES, job_system::ScheduleMode::FIFO);
        }

        jobs.wait_for_completion();
        jobs.shutdown();
        jobs.rethrow_if_error();
    }

    // === ASSEMBLY (input order) ===

    for (const auto& set : sets) {
        if (set.shortfall() > 0) {
            result.shortfalls.push_back({set.position, set.case_id, set.requested, set.control_rows.size()});
            CCMATCH_WARN("case %s: %zu of %zu controls found (%zu eligible)",
                         set.case_id.to_string().c_str(), set.control_rows.size(),
                         set.requested, set.eligible);
        }
        assembler.add(set, case_table, pool);
    }

    result.table = assembler.finish();
    result.sets = std::move(sets);
    return result;
}

MatchResult get_matches(const Table& cases, const Table& control_pool, const MatchConfig& config,
                        const FieldConventions& conventions) {
    return MatchEngine(config, conventions).get_matches(cases, control_pool);
}

} // namespace ccmatch
