#pragma once

/// @file ga.hpp
/// @brief Time-boxed evolutionary lineup search
///
/// Each round draws a batch of random lineups, keeps the three best, mates them pairwise
/// and tops the round up with fresh lineups. Rounds repeat until the wall-clock budget is
/// spent; the accumulated population is ranked and trimmed once at the end.

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

#include <lineuplab/core/concepts.hpp>
#include <lineuplab/core/population.hpp>
#include <lineuplab/problems/lineup.hpp>
#include <lineuplab/problems/roster.hpp>

namespace lineuplab::core {

/// Lineups drawn per round before ranking
inline constexpr std::size_t ROUND_BATCH_SIZE = 10;
/// Top-ranked batch members kept and mated pairwise
inline constexpr std::size_t ROUND_ELITE_COUNT = 3;
/// Children bred per round, one per elite pair
inline constexpr std::size_t ROUND_MATING_COUNT = ROUND_ELITE_COUNT * (ROUND_ELITE_COUNT - 1) / 2;
/// Fresh lineups appended after the matings
inline constexpr std::size_t ROUND_FRESH_COUNT = 4;
/// Lineups appended to the population per round
inline constexpr std::size_t LINEUPS_PER_ROUND =
    ROUND_ELITE_COUNT + ROUND_MATING_COUNT + ROUND_FRESH_COUNT;

/// Rounds' worth of population storage reserved up front; growth beyond it reallocates
inline constexpr std::size_t MAX_RESERVED_ROUNDS = 1000;

/// Configuration for the lineup search
struct SearchConfig {
    std::size_t num_lineups = 100;            // Lineups kept after the final trim
    std::chrono::milliseconds time_limit{60000}; // Wall-clock budget, checked between rounds
    std::size_t max_rounds = 0;               // 0 means no round cap
    std::uint64_t seed = 1;
    std::size_t log_interval = 100; // Record round statistics every N rounds
};

/// Statistics snapshot taken after a round
struct RoundStats {
    std::size_t round;
    Fitness best_fitness;
    std::size_t population_size;
    std::chrono::milliseconds elapsed_time;
};

/// Result of a lineup search
struct SearchResult {
    Population<problems::Lineup> lineups; // Sorted by descending score, at most num_lineups
    problems::Lineup best_lineup;
    Fitness best_fitness;
    std::size_t rounds = 0;
    std::size_t lineups_generated = 0;
    std::size_t matings = 0;
    std::chrono::milliseconds total_time{0};
    std::vector<RoundStats> history;
};

/// Evolutionary lineup search over a fixed player pool
template <typename Generator, typename Crossover>
class LineupSearch {
  private:
    Generator generator_;
    Crossover crossover_;

    mutable std::mt19937 rng_;

  public:
    LineupSearch(Generator gen, Crossover cross)
        : generator_(std::move(gen)), crossover_(std::move(cross)) {}

    /// Run the search until the time limit (or round cap) is reached
    SearchResult run(const problems::PlayerPool& pool, const SearchConfig& config = {})
        requires LineupGenerator<Generator> && LineupCrossover<Crossover>
    {
        rng_.seed(config.seed);

        const auto start_time = std::chrono::steady_clock::now();
        const auto deadline = deadline_after(start_time, config.time_limit);

        SearchResult result;
        Population<problems::Lineup> population(initial_capacity(config));
        Fitness best_fitness{0.0};

        std::size_t rounds = 0;
        while (std::chrono::steady_clock::now() < deadline &&
               (config.max_rounds == 0 || rounds < config.max_rounds)) {
            run_round(pool, population, result);
            ++rounds;

            if (config.log_interval > 0 && rounds % config.log_interval == 0) {
                best_fitness = std::max(best_fitness, population.fitness(population.best_index()));
                result.history.push_back(
                    {rounds, best_fitness, population.size(),
                     std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - start_time)});
            }
        }

        population.sort_descending();
        population.truncate(config.num_lineups);

        if (!population.empty()) {
            result.best_lineup = population.genome(0);
            result.best_fitness = population.fitness(0);
        }
        result.lineups = std::move(population);
        result.rounds = rounds;
        result.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        return result;
    }

  private:
    /// Start time plus budget, saturating at the clock's maximum
    static std::chrono::steady_clock::time_point
    deadline_after(std::chrono::steady_clock::time_point start, std::chrono::milliseconds budget) {
        const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::time_point::max() - start);
        if (budget >= headroom)
            return std::chrono::steady_clock::time_point::max();
        return start + budget;
    }

    /// Reservation covers at most MAX_RESERVED_ROUNDS rounds
    static std::size_t initial_capacity(const SearchConfig& config) noexcept {
        const std::size_t wanted_rounds =
            config.max_rounds > 0 ? config.max_rounds
                                  : config.num_lineups / LINEUPS_PER_ROUND + 1;
        return std::min(wanted_rounds, MAX_RESERVED_ROUNDS) * LINEUPS_PER_ROUND;
    }

  public:
    /// Run one round, appending exactly LINEUPS_PER_ROUND lineups to the population
    void run_round(const problems::PlayerPool& pool, Population<problems::Lineup>& population,
                   SearchResult& result) const
        requires LineupGenerator<Generator> && LineupCrossover<Crossover>
    {
        std::vector<problems::Lineup> batch;
        batch.reserve(ROUND_BATCH_SIZE);
        for (std::size_t i = 0; i < ROUND_BATCH_SIZE; ++i) {
            batch.push_back(generator_.generate(pool, rng_));
        }
        result.lineups_generated += ROUND_BATCH_SIZE;

        std::stable_sort(batch.begin(), batch.end(),
                         [](const problems::Lineup& a, const problems::Lineup& b) {
                             return a.projection > b.projection;
                         });

        for (std::size_t i = 0; i < ROUND_ELITE_COUNT; ++i) {
            population.push_back(batch[i], fitness_of(batch[i]));
        }

        // Pairwise matings among the elites: 1x2, 1x3, 2x3
        constexpr std::array<std::pair<std::size_t, std::size_t>, ROUND_MATING_COUNT> pairs = {
            {{0, 1}, {0, 2}, {1, 2}}};
        for (const auto& [a, b] : pairs) {
            auto child = crossover_.cross(batch[a], batch[b], pool, rng_);
            const auto fitness = fitness_of(child);
            population.push_back(std::move(child), fitness);
        }
        result.matings += pairs.size();

        for (std::size_t i = 0; i < ROUND_FRESH_COUNT; ++i) {
            auto lineup = generator_.generate(pool, rng_);
            const auto fitness = fitness_of(lineup);
            population.push_back(std::move(lineup), fitness);
        }
        result.lineups_generated += ROUND_FRESH_COUNT;
    }
};

/// Factory function for creating lineup searches
template <typename Generator, typename Crossover>
auto make_search(Generator gen, Crossover cross) {
    return LineupSearch<Generator, Crossover>(std::move(gen), std::move(cross));
}

} // namespace lineuplab::core
