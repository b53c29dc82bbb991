#include <algorithm>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <lineuplab/operators/crossover.hpp>
#include <lineuplab/operators/generation.hpp>
#include <lineuplab/problems/lineup.hpp>

#include "roster_fixtures.hpp"
#include "test_helper.hpp"

using namespace lineuplab;
using problems::LineupValidator;
using problems::Position;

namespace {

/// Four-team roster split into two disjoint camps (AAA/BBB and CCC/DDD) for the parents
std::vector<problems::Player> two_camp_players() {
    std::vector<problems::Player> players;
    const std::vector<std::string> camp_a = {"AAA", "BBB"};
    const std::vector<std::string> camp_b = {"CCC", "DDD"};
    for (int i = 0; i < 4; ++i) {
        const auto& team_a = camp_a[i % 2];
        const auto& team_b = camp_b[i % 2];
        const auto id = std::to_string(i);
        players.push_back(fixtures::make_player("A-C" + id, Position::Center, 4000, team_a, 10));
        players.push_back(fixtures::make_player("A-W" + id, Position::Winger, 4000, team_a, 9));
        players.push_back(fixtures::make_player("A-D" + id, Position::Defenseman, 3500, team_a, 8));
        players.push_back(fixtures::make_player("B-C" + id, Position::Center, 4000, team_b, 10));
        players.push_back(fixtures::make_player("B-W" + id, Position::Winger, 4000, team_b, 9));
        players.push_back(fixtures::make_player("B-D" + id, Position::Defenseman, 3500, team_b, 8));
    }
    players.push_back(fixtures::make_player("A-G", Position::Goalie, 7000, "AAA", 12));
    players.push_back(fixtures::make_player("B-G", Position::Goalie, 7000, "CCC", 12));
    return players;
}

/// Validated lineup assembled from named players
problems::Lineup lineup_of(const problems::PlayerPool& pool,
                           const std::vector<std::string>& names,
                           problems::LineupRules rules = {}) {
    return *LineupValidator(rules).validate(fixtures::slots_of(pool, names));
}

bool contains(const problems::Slots& slots, std::size_t first, std::size_t count,
              const problems::Player* player) {
    for (std::size_t i = first; i < first + count; ++i) {
        if (slots[i] == player)
            return true;
    }
    return false;
}

} // namespace

void test_child_players_trace_to_sources(TestResult& result) {
    auto pool = fixtures::feasible_pool();
    operators::RandomLineupGenerator generator;
    operators::PooledRoleCrossover crossover;
    std::mt19937 rng(2024);

    const auto parent1 = generator.generate(pool, rng);
    const auto parent2 = generator.generate(pool, rng);

    bool traceable = true;
    bool group_local = true;
    for (int i = 0; i < 500; ++i) {
        const auto child = crossover.build_candidate(parent1, parent2, pool, rng);

        for (std::size_t g = 0; g < problems::SLOT_TABLE.size(); ++g) {
            const auto& spec = problems::SLOT_TABLE[g];
            for (std::size_t s = spec.first_slot; s < spec.first_slot + spec.count; ++s) {
                const auto* player = child.slots[s];
                const bool from_parents =
                    contains(parent1.players, spec.first_slot, spec.count, player) ||
                    contains(parent2.players, spec.first_slot, spec.count, player);
                const bool injected = player == child.injected[g];

                group_local = group_local && (from_parents || injected);

                const bool anywhere =
                    std::find(parent1.players.begin(), parent1.players.end(), player) !=
                        parent1.players.end() ||
                    std::find(parent2.players.begin(), parent2.players.end(), player) !=
                        parent2.players.end() ||
                    std::find(child.injected.begin(), child.injected.end(), player) !=
                        child.injected.end();
                traceable = traceable && anywhere;
            }
        }
    }

    result.assert_true(traceable, "Every child player comes from a parent or an injected draw");
    result.assert_true(group_local,
                       "Every child slot comes from the same role group of a parent or its "
                       "group's injected draw");
}

void test_injected_players_match_role(TestResult& result) {
    auto pool = fixtures::feasible_pool();
    operators::RandomLineupGenerator generator;
    operators::PooledRoleCrossover crossover;
    std::mt19937 rng(11);

    const auto parent1 = generator.generate(pool, rng);
    const auto parent2 = generator.generate(pool, rng);

    bool roles_match = true;
    for (int i = 0; i < 200; ++i) {
        const auto child = crossover.build_candidate(parent1, parent2, pool, rng);
        for (std::size_t g = 0; g < problems::SLOT_TABLE.size(); ++g) {
            const auto candidates = pool.group(problems::SLOT_TABLE[g].group);
            roles_match = roles_match && std::find(candidates.begin(), candidates.end(),
                                                   child.injected[g]) != candidates.end();
        }
    }
    result.assert_true(roles_match, "Injected players are drawn from their own role group");
}

void test_sampling_without_replacement(TestResult& result) {
    auto pool = fixtures::feasible_pool();
    operators::PooledRoleCrossover crossover;
    std::mt19937 rng(5);

    // Parents share no players, so any repeated player within a group would have to come
    // from sampling the same local-pool entry twice or from the injected draw
    const auto parent1 = lineup_of(pool, {"Center 0", "Center 1", "Winger 0", "Winger 1",
                                          "Winger 2", "Defense 0", "Defense 1", "Goalie 0",
                                          "Center 2"});
    const auto parent2 = lineup_of(pool, {"Center 3", "Center 4", "Winger 3", "Winger 4",
                                          "Winger 5", "Defense 3", "Defense 4", "Goalie 1",
                                          "Defense 5"});

    bool distinct_within_group = true;
    for (int i = 0; i < 500; ++i) {
        const auto child = crossover.build_candidate(parent1, parent2, pool, rng);
        for (std::size_t g = 0; g < problems::SLOT_TABLE.size(); ++g) {
            const auto& spec = problems::SLOT_TABLE[g];
            const bool injected_repeats_parent =
                contains(parent1.players, spec.first_slot, spec.count, child.injected[g]) ||
                contains(parent2.players, spec.first_slot, spec.count, child.injected[g]);
            if (injected_repeats_parent)
                continue;

            for (std::size_t a = spec.first_slot; a < spec.first_slot + spec.count; ++a) {
                for (std::size_t b = a + 1; b < spec.first_slot + spec.count; ++b) {
                    distinct_within_group = distinct_within_group && child.slots[a] != child.slots[b];
                }
            }
        }
    }
    result.assert_true(distinct_within_group,
                       "A local pool entry is never sampled twice within one attempt");
}

void test_children_are_valid(TestResult& result) {
    auto pool = fixtures::feasible_pool();
    operators::RandomLineupGenerator generator;
    operators::PooledRoleCrossover crossover;
    std::mt19937 rng(77);

    bool all_valid = true;
    for (int i = 0; i < 100; ++i) {
        const auto parent1 = generator.generate(pool, rng);
        const auto parent2 = generator.generate(pool, rng);
        const auto child = crossover.cross(parent1, parent2, pool, rng);

        all_valid = all_valid && child.salary < 50000 &&
                    LineupValidator::distinct_teams(child.players) >= 3 &&
                    LineupValidator::distinct_players(child.players) == 9 &&
                    child.salary == LineupValidator::total_salary(child.players);
    }
    result.assert_true(all_valid, "Crossover children satisfy every constraint");
}

void test_disjoint_team_parents(TestResult& result) {
    auto pool = problems::PlayerPool::from_players(two_camp_players());
    operators::PooledRoleCrossover crossover;
    std::mt19937 rng(314);

    const auto parent1 = lineup_of(pool, {"A-C0", "A-C1", "A-W0", "A-W1", "A-W2", "A-D0",
                                          "A-D1", "A-G", "A-C2"},
                                   problems::LineupRules{50000, 2});
    const auto parent2 = lineup_of(pool, {"B-C0", "B-C1", "B-W0", "B-W1", "B-W2", "B-D0",
                                          "B-D1", "B-G", "B-C2"},
                                   problems::LineupRules{50000, 2});

    bool all_diverse = true;
    for (int i = 0; i < 100; ++i) {
        const auto child = crossover.cross(parent1, parent2, pool, rng);
        all_diverse = all_diverse && LineupValidator::distinct_teams(child.players) >= 3;
    }
    result.assert_true(all_diverse, "100 children of disjoint-team parents all span 3+ teams");
}

void test_infeasible_crossover_throws(TestResult& result) {
    auto pool = fixtures::single_team_pool();
    operators::PooledRoleCrossover crossover(problems::LineupRules{}, 200);
    std::mt19937 rng(8);

    // Parents validated under relaxed rules; children can never reach three teams
    const problems::LineupRules one_team{50000, 1};
    const auto parent = lineup_of(pool, {"Solo C1", "Solo C2", "Solo W1", "Solo W2", "Solo W3",
                                         "Solo D1", "Solo D2", "Solo G", "Solo U"},
                                  one_team);

    result.assert_throws<operators::NoFeasibleLineupError>(
        [&] { (void)crossover.cross(parent, parent, pool, rng); },
        "Crossover gives up after the attempt ceiling");
}

int main() {
    std::cout << "=== LineupLab Crossover Tests ===\n\n";

    TestResult result;

    test_child_players_trace_to_sources(result);
    test_injected_players_match_role(result);
    test_sampling_without_replacement(result);
    test_children_are_valid(result);
    test_disjoint_team_parents(result);
    test_infeasible_crossover_throws(result);

    return result.summary();
}
