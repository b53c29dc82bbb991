#pragma once

#include <cstddef>
#include <optional>
#include <random>
#include <span>
#include <stdexcept>
#include <string>

#include <lineuplab/problems/lineup.hpp>
#include <lineuplab/problems/roster.hpp>

namespace lineuplab::operators {

/// Thrown when the retry budget runs out before a candidate validates
class NoFeasibleLineupError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Default retry ceiling for generation and crossover
inline constexpr std::size_t DEFAULT_MAX_ATTEMPTS = 100000;

/// Draw one player uniformly from a non-empty sequence
inline const problems::Player* draw_uniform(std::span<const problems::Player* const> players,
                                            std::mt19937& rng) {
    std::uniform_int_distribution<std::size_t> dist(0, players.size() - 1);
    return players[dist(rng)];
}

/// Throw unless every role group has at least one candidate
inline void require_all_groups(const problems::PlayerPool& pool) {
    for (const auto& spec : problems::SLOT_TABLE) {
        if (pool.group(spec.group).empty()) {
            throw NoFeasibleLineupError("No feasible lineup found: no " +
                                        std::string(problems::to_string(spec.group)) +
                                        " candidates in player pool");
        }
    }
}

/// Random lineup generation by independent per-slot draws
///
/// Each slot is drawn uniformly from its role sequence; the same player may land in two
/// slots, which the validator rejects. Rejected candidates are redrawn from scratch
/// until one validates or the attempt budget runs out.
class RandomLineupGenerator {
  private:
    problems::LineupValidator validator_;
    std::size_t max_attempts_;

  public:
    explicit RandomLineupGenerator(problems::LineupRules rules = {},
                                   std::size_t max_attempts = DEFAULT_MAX_ATTEMPTS)
        : validator_(rules), max_attempts_(max_attempts) {}

    [[nodiscard]] std::size_t max_attempts() const noexcept { return max_attempts_; }
    [[nodiscard]] const problems::LineupValidator& validator() const noexcept {
        return validator_;
    }

    /// One unvalidated candidate
    problems::Slots draw(const problems::PlayerPool& pool, std::mt19937& rng) const {
        problems::Slots slots{};
        for (std::size_t slot = 0; slot < problems::LINEUP_SIZE; ++slot) {
            slots[slot] = draw_uniform(pool.group(problems::slot_group(slot)), rng);
        }
        return slots;
    }

    /// Generate a validated lineup, or nullopt when the attempt budget is exhausted
    std::optional<problems::Lineup> try_generate(const problems::PlayerPool& pool,
                                                 std::mt19937& rng) const {
        if (!pool.covers_all_groups())
            return std::nullopt;

        for (std::size_t attempt = 0; attempt < max_attempts_; ++attempt) {
            if (auto lineup = validator_.validate(draw(pool, rng))) {
                return lineup;
            }
        }
        return std::nullopt;
    }

    /// Generate a validated lineup
    /// @throws NoFeasibleLineupError if the pool lacks a role or no candidate validates
    problems::Lineup generate(const problems::PlayerPool& pool, std::mt19937& rng) const {
        require_all_groups(pool);

        if (auto lineup = try_generate(pool, rng)) {
            return *lineup;
        }
        throw NoFeasibleLineupError("No feasible lineup found after " +
                                    std::to_string(max_attempts_) + " random draws");
    }
};

} // namespace lineuplab::operators
