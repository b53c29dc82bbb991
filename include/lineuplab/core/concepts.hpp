#pragma once

#include <compare>
#include <concepts>
#include <random>
#include <utility>

#include <lineuplab/problems/lineup.hpp>
#include <lineuplab/problems/roster.hpp>

namespace lineuplab::core {

/// Fitness value of a lineup (summed projected points, higher is better)
struct Fitness {
    double value;

    constexpr Fitness() : value(0.0) {} // Initialize to deterministic value
    constexpr explicit Fitness(double v) : value(v) {}

    constexpr auto operator<=>(const Fitness&) const = default;

    constexpr Fitness& operator+=(const Fitness& other) {
        value += other.value;
        return *this;
    }
};

/// Fitness of a validated lineup
constexpr Fitness fitness_of(const problems::Lineup& lineup) noexcept {
    return Fitness{lineup.projection};
}

/// Concept for lineup generators
///
/// A generator draws a fresh lineup from the pool. Implementations retry internally
/// until the candidate validates and report exhaustion by throwing.
template <typename G>
concept LineupGenerator = requires(const G& generator, const problems::PlayerPool& pool,
                                   std::mt19937& rng) {
    { generator.generate(pool, rng) } -> std::same_as<problems::Lineup>;
};

/// Concept for crossover operators
///
/// Produces a single validated child from two validated parents. The pool is passed so
/// the operator can inject players that neither parent carries.
template <typename C>
concept LineupCrossover =
    requires(const C& crossover, const problems::Lineup& parent1, const problems::Lineup& parent2,
             const problems::PlayerPool& pool, std::mt19937& rng) {
        { crossover.cross(parent1, parent2, pool, rng) } -> std::same_as<problems::Lineup>;
    };

} // namespace lineuplab::core
