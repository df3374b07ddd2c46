#include <ccmatch/progress.hpp>
#include <memory>
#include <mutex>

namespace ccmatch {

ProgressTracker make_dot_tracker(std::ostream& out, std::size_t every) {
    struct State {
        std::mutex mutex;
        std::size_t done = 0;
    };
    auto state = std::make_shared<State>();
    if (every == 0) every = 1;

    return [&out, every, state](std::size_t, const Value&) {
        std::lock_guard<std::mutex> lock(state->mutex);
        ++state->done;
        out << '.';
        if (state->done % every == 0) {
            out << ' ' << state->done << '\n';
        }
        out.flush();
    };
}

ProgressTracker make_counting_tracker(std::atomic<std::size_t>& counter) {
    return [&counter](std::size_t, const Value&) {
        counter.fetch_add(1, std::memory_order_relaxed);
    };
}

} // namespace ccmatch
