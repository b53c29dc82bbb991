#pragma once

#include <array>
#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include <lineuplab/operators/generation.hpp>
#include <lineuplab/problems/lineup.hpp>
#include <lineuplab/problems/roster.hpp>

namespace lineuplab::operators {

/// One unvalidated crossover attempt
struct Offspring {
    problems::Slots slots{};
    /// Fresh draw added to each role group's local pool, in SLOT_TABLE order
    std::array<const problems::Player*, problems::ROLE_GROUP_COUNT> injected{};
};

/// Role-pooled crossover
///
/// For every role group the local pool holds both parents' players for that group plus
/// one fresh random player of the same group. The group's slots are then sampled from
/// the local pool without replacement. Rejected children are rebuilt from scratch with
/// new draws in every group.
class PooledRoleCrossover {
  private:
    problems::LineupValidator validator_;
    std::size_t max_attempts_;

  public:
    explicit PooledRoleCrossover(problems::LineupRules rules = {},
                                 std::size_t max_attempts = DEFAULT_MAX_ATTEMPTS)
        : validator_(rules), max_attempts_(max_attempts) {}

    [[nodiscard]] std::size_t max_attempts() const noexcept { return max_attempts_; }

    /// Build one candidate child without validating it
    Offspring build_candidate(const problems::Lineup& parent1, const problems::Lineup& parent2,
                              const problems::PlayerPool& pool, std::mt19937& rng) const {
        Offspring child;
        std::vector<const problems::Player*> local_pool;
        local_pool.reserve(2 * problems::LINEUP_SIZE + 1);

        for (std::size_t g = 0; g < problems::SLOT_TABLE.size(); ++g) {
            const auto& spec = problems::SLOT_TABLE[g];

            local_pool.clear();
            for (std::size_t i = 0; i < spec.count; ++i) {
                local_pool.push_back(parent1.players[spec.first_slot + i]);
            }
            for (std::size_t i = 0; i < spec.count; ++i) {
                local_pool.push_back(parent2.players[spec.first_slot + i]);
            }
            child.injected[g] = draw_uniform(pool.group(spec.group), rng);
            local_pool.push_back(child.injected[g]);

            // Sample without replacement: a picked entry leaves the local pool
            for (std::size_t i = 0; i < spec.count; ++i) {
                std::uniform_int_distribution<std::size_t> dist(0, local_pool.size() - 1);
                const auto pick = dist(rng);
                child.slots[spec.first_slot + i] = local_pool[pick];
                local_pool.erase(local_pool.begin() + static_cast<std::ptrdiff_t>(pick));
            }
        }
        return child;
    }

    /// Mate two validated parents into a validated child
    /// @throws NoFeasibleLineupError if the pool lacks a role or no child validates
    problems::Lineup cross(const problems::Lineup& parent1, const problems::Lineup& parent2,
                           const problems::PlayerPool& pool, std::mt19937& rng) const {
        require_all_groups(pool);

        for (std::size_t attempt = 0; attempt < max_attempts_; ++attempt) {
            auto child = build_candidate(parent1, parent2, pool, rng);
            if (auto lineup = validator_.validate(child.slots)) {
                return *lineup;
            }
        }
        throw NoFeasibleLineupError("No feasible child lineup found after " +
                                    std::to_string(max_attempts_) + " crossover attempts");
    }
};

} // namespace lineuplab::operators
