#pragma once

// Core components
#include "core/concepts.hpp"
#include "core/ga.hpp"
#include "core/population.hpp"

// Problem model
#include "problems/lineup.hpp"
#include "problems/roster.hpp"

// Genetic operators
#include "operators/crossover.hpp"
#include "operators/generation.hpp"

// IO
#include "io/lineup_csv.hpp"
#include "io/roster_csv.hpp"

// Configuration
#include "config/config.hpp"

/**
 * @file lineuplab.hpp
 * @brief Main header for LineupLab - evolutionary lineup search for salary-capped contests
 *
 * LineupLab builds fantasy hockey lineups (C, C, W, W, W, D, D, G, UTIL) from a roster
 * export and evolves them under a wall-clock budget: random generation, ranking,
 * crossover of the best lineups and validation against the salary cap, team diversity
 * and player uniqueness rules.
 *
 * Basic usage:
 * @code
 * #include <lineuplab/lineuplab.hpp>
 * using namespace lineuplab;
 *
 * auto pool = io::RosterParser::parse_file("DKSalaries.csv");
 * auto search = factory::make_default_search();
 *
 * auto result = search.run(pool, core::SearchConfig{
 *     .num_lineups = 100,
 *     .time_limit = std::chrono::seconds(60)
 * });
 *
 * io::LineupWriter::write_full("lineups.csv", result.lineups.genomes());
 * @endcode
 */

namespace lineuplab {

/// Current version
constexpr const char* VERSION = "0.1.0";

/// Factory functions for common configurations
namespace factory {

/// Random generation plus role-pooled crossover under the given rules
inline auto make_default_search(problems::LineupRules rules = {},
                                std::size_t max_attempts = operators::DEFAULT_MAX_ATTEMPTS) {
    return core::make_search(operators::RandomLineupGenerator{rules, max_attempts},
                             operators::PooledRoleCrossover{rules, max_attempts});
}

/// Search configured from a loaded configuration file
inline auto make_search_from_config(const config::Config& cfg) {
    return make_default_search(cfg.lineup_rules(), cfg.search.max_attempts);
}

} // namespace factory

} // namespace lineuplab
