#include <ccmatch/sampler.hpp>
#include <utility>

namespace ccmatch {

Sampler::Engine Sampler::case_stream(std::uint64_t seed, std::size_t position) {
    const std::uint64_t pos = static_cast<std::uint64_t>(position);
    std::seed_seq sequence{
        static_cast<std::uint32_t>(seed), static_cast<std::uint32_t>(seed >> 32),
        static_cast<std::uint32_t>(pos), static_cast<std::uint32_t>(pos >> 32)
    };
    return Engine(sequence);
}

SampleOutcome Sampler::draw(const std::vector<std::size_t>& candidates, std::size_t n, Engine& rng) {
    SampleOutcome outcome;
    outcome.requested = n;
    outcome.available = candidates.size();

    if (candidates.size() <= n) {
        outcome.selected = candidates;
        return outcome;
    }

    // Partial Fisher-Yates: the first n slots end up a uniform sample
    std::vector<std::size_t> pool = candidates;
    for (std::size_t i = 0; i < n; ++i) {
        std::uniform_int_distribution<std::size_t> pick(i, pool.size() - 1);
        std::swap(pool[i], pool[pick(rng)]);
    }

    pool.resize(n);
    outcome.selected = std::move(pool);
    return outcome;
}

} // namespace ccmatch
