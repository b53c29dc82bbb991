#pragma once

#include <string>
#include <vector>

#include <lineuplab/problems/lineup.hpp>
#include <lineuplab/problems/roster.hpp>

// Synthetic rosters shared by the test executables
namespace fixtures {

using lineuplab::problems::Player;
using lineuplab::problems::PlayerPool;
using lineuplab::problems::Position;

inline Player make_player(std::string name, Position position, int salary, std::string team,
                          double points) {
    return Player{std::move(name), position, salary, std::move(team), points};
}

/// Three teams, three or more candidates per role, every lineup well under the cap
inline std::vector<Player> feasible_players() {
    const std::vector<std::string> teams = {"BOS", "TOR", "MTL"};
    std::vector<Player> players;
    for (int i = 0; i < 6; ++i) {
        const auto& team = teams[i % teams.size()];
        players.push_back(make_player("Center " + std::to_string(i), Position::Center,
                                      4000 + 100 * i, team, 10.0 + i));
        players.push_back(make_player("Winger " + std::to_string(i), Position::Winger,
                                      3800 + 100 * i, team, 9.0 + i));
        players.push_back(make_player("Defense " + std::to_string(i), Position::Defenseman,
                                      3500 + 100 * i, team, 7.5 + i));
    }
    for (int i = 0; i < 3; ++i) {
        players.push_back(make_player("Goalie " + std::to_string(i), Position::Goalie,
                                      7000 + 200 * i, teams[i], 12.25 + i));
    }
    return players;
}

inline PlayerPool feasible_pool() { return PlayerPool::from_players(feasible_players()); }

/// One player per required role, all on the same team; no lineup can ever validate
inline PlayerPool single_team_pool() {
    std::vector<Player> players = {
        make_player("Solo C1", Position::Center, 1000, "BOS", 5.0),
        make_player("Solo C2", Position::Center, 1000, "BOS", 5.0),
        make_player("Solo W1", Position::Winger, 1000, "BOS", 5.0),
        make_player("Solo W2", Position::Winger, 1000, "BOS", 5.0),
        make_player("Solo W3", Position::Winger, 1000, "BOS", 5.0),
        make_player("Solo D1", Position::Defenseman, 1000, "BOS", 5.0),
        make_player("Solo D2", Position::Defenseman, 1000, "BOS", 5.0),
        make_player("Solo G", Position::Goalie, 1000, "BOS", 5.0),
        make_player("Solo U", Position::Center, 1000, "BOS", 5.0),
    };
    return PlayerPool::from_players(std::move(players));
}

/// Slots filled in order from the named players of a pool
inline lineuplab::problems::Slots slots_of(const PlayerPool& pool,
                                           const std::vector<std::string>& names) {
    lineuplab::problems::Slots slots{};
    for (std::size_t i = 0; i < slots.size() && i < names.size(); ++i) {
        slots[i] = pool.find(names[i]);
    }
    return slots;
}

} // namespace fixtures
