#ifndef CCMATCH_PROGRESS_HPP
#define CCMATCH_PROGRESS_HPP

#include <ccmatch/match_config.hpp>
#include <atomic>
#include <ostream>

namespace ccmatch {

/**
 * Console tracker: prints a dot per processed case and the running count
 * every `every` cases. Writes are serialized, so the tracker may be shared
 * by parallel workers.
 */
ProgressTracker make_dot_tracker(std::ostream& out, std::size_t every = 50);

/**
 * Tracker that only counts invocations; useful for callers that poll.
 */
ProgressTracker make_counting_tracker(std::atomic<std::size_t>& counter);

} // namespace ccmatch

#endif // CCMATCH_PROGRESS_HPP
