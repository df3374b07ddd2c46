#include <ccmatch/case_matcher.hpp>
#include <ccmatch/log.hpp>
#include <ccmatch/sampler.hpp>
#include <limits>
#include <stdexcept>

namespace ccmatch {

namespace {

MatchedSet sample_for_case(const MatchContext& context, const ControlPool& pool,
                           std::size_t position, bool apply_index_date) {
    const Row& case_row = context.cases->row(position);
    EligibilityPredicate predicate(case_row, *context.columns, context.extra_conditions, apply_index_date);

    std::vector<std::size_t> candidates = pool.eligible(predicate);

    Sampler::Engine rng = Sampler::case_stream(context.seed, position);
    SampleOutcome outcome = Sampler::draw(candidates, context.n_controls, rng);

    MatchedSet set;
    set.position = position;
    set.case_id = predicate.case_id();
    set.control_rows = std::move(outcome.selected);
    set.requested = outcome.requested;
    set.eligible = outcome.available;

    CCMATCH_DEBUG("Case %s: %zu eligible, %zu drawn",
                  set.case_id.to_string().c_str(), set.eligible, set.control_rows.size());
    return set;
}

} // namespace

MatchedSet ExactCaseMatcher::match_case(std::size_t position) {
    MatchedSet set = sample_for_case(context_, pool_, position, false);
    pool_.remove_rows(set.control_rows);
    return set;
}

MatchedSet IncidenceDensityCaseMatcher::match_case(std::size_t position) {
    return sample_for_case(context_, pool_, position, true);
}

std::size_t IncidenceDensityCaseMatcher::max_workers() const {
    return std::numeric_limits<std::size_t>::max();
}

std::unique_ptr<CaseMatcher> make_case_matcher(MatchMethod method, const MatchContext& context,
                                               ControlPool& pool) {
    switch (method) {
        case MatchMethod::Exact:
            return std::make_unique<ExactCaseMatcher>(context, pool);
        case MatchMethod::IncidenceDensity:
            return std::make_unique<IncidenceDensityCaseMatcher>(context, pool);
    }
    throw std::logic_error("unknown matching method");
}

} // namespace ccmatch
