/**
 * @file basic-search.cpp
 * @brief Basic lineup search using LineupLab
 *
 * This example builds a small synthetic slate in memory, runs the evolutionary lineup
 * search for a fixed number of rounds and prints the best lineups it found.
 *
 * Build with the `basic_search` CMake target:
 *   cmake -S . -B build && cmake --build build --target basic_search
 *
 * or compile directly, adding toml11's include path (pulled in by lineuplab.hpp):
 *   g++ -std=c++23 -I../../include -I<toml11-prefix>/include basic-search.cpp -o basic-search
 *
 * Run with:
 *   ./basic-search
 */

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <lineuplab/lineuplab.hpp>

using namespace lineuplab;

namespace {

/// Random slate of six teams with five skaters per role and one goalie per team
problems::PlayerPool make_demo_slate(std::uint32_t seed) {
    const std::vector<std::string> teams = {"BOS", "TOR", "MTL", "NYR", "EDM", "COL"};
    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> salary_steps(0, 30);
    std::uniform_real_distribution<double> points(2.0, 20.0);

    std::vector<problems::Player> players;
    const std::vector<std::pair<problems::Position, std::string>> roles = {
        {problems::Position::Center, "C"},
        {problems::Position::Winger, "W"},
        {problems::Position::Defenseman, "D"}};

    for (const auto& team : teams) {
        for (const auto& [position, code] : roles) {
            for (int i = 0; i < 5; ++i) {
                players.push_back({team + " " + code + std::to_string(i + 1), position,
                                   2500 + 100 * salary_steps(rng), team, points(rng)});
            }
        }
        players.push_back({team + " G", problems::Position::Goalie,
                           7000 + 100 * salary_steps(rng) / 3, team, points(rng)});
    }
    return problems::PlayerPool::from_players(std::move(players));
}

} // namespace

int main() {
    std::cout << "LineupLab Basic Search Example\n";
    std::cout << "==============================\n\n";

    auto pool = make_demo_slate(2024);
    std::cout << "Slate: " << pool.size() << " players (" << pool.centers().size() << " C, "
              << pool.wingers().size() << " W, " << pool.defensemen().size() << " D, "
              << pool.goalies().size() << " G)\n\n";

    // Random generation plus role-pooled crossover under the default contest rules
    auto search = factory::make_default_search();

    core::SearchConfig config{
        .num_lineups = 5,                          // Lineups kept after the final trim
        .time_limit = std::chrono::seconds(10),    // Wall-clock budget
        .max_rounds = 200,                         // Stop early after 200 rounds
        .seed = 123                                // Random seed for reproducibility
    };

    std::cout << "Running search...\n";
    auto result = search.run(pool, config);

    std::cout << "\nResults:\n";
    std::cout << "========\n";
    std::cout << "Rounds:       " << result.rounds << "\n";
    std::cout << "Generated:    " << result.lineups_generated << "\n";
    std::cout << "Matings:      " << result.matings << "\n";
    std::cout << "Runtime:      " << result.total_time.count() << " ms\n";
    std::cout << "Best score:   " << std::fixed << std::setprecision(2)
              << result.best_fitness.value << "\n\n";

    io::LineupWriter::format_full(std::cout, result.lineups.genomes());

    return result.lineups.empty() ? 1 : 0;
}
