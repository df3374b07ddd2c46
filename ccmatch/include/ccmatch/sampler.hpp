#ifndef CCMATCH_SAMPLER_HPP
#define CCMATCH_SAMPLER_HPP

#include <cstdint>
#include <random>
#include <vector>

namespace ccmatch {

struct SampleOutcome {
    std::vector<std::size_t> selected;
    std::size_t requested = 0;
    std::size_t available = 0;

    std::size_t shortfall() const {
        return requested > selected.size() ? requested - selected.size() : 0;
    }
};

/**
 * Draws controls without replacement.
 *
 * Each case gets its own generator derived from the run seed and the case's
 * input position, so a case's draw does not depend on which worker runs it
 * or on what other cases drew before it.
 */
class Sampler {
public:
    using Engine = std::mt19937_64;

    static Engine case_stream(std::uint64_t seed, std::size_t position);

    /**
     * Uniform sample of min(n, candidates.size()) distinct candidates.
     * When no more than n are available every candidate is taken, in the
     * given order, and the generator is left untouched.
     */
    static SampleOutcome draw(const std::vector<std::size_t>& candidates, std::size_t n, Engine& rng);
};

} // namespace ccmatch

#endif // CCMATCH_SAMPLER_HPP
