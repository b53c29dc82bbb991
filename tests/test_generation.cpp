#include <algorithm>
#include <iostream>
#include <random>
#include <string>

#include <lineuplab/operators/generation.hpp>
#include <lineuplab/problems/lineup.hpp>

#include "roster_fixtures.hpp"
#include "test_helper.hpp"

using namespace lineuplab;
using problems::LineupValidator;
using problems::RoleGroup;

namespace {

bool in_group(const problems::PlayerPool& pool, RoleGroup group, const problems::Player* player) {
    const auto candidates = pool.group(group);
    return std::find(candidates.begin(), candidates.end(), player) != candidates.end();
}

} // namespace

void test_generated_lineups_satisfy_constraints(TestResult& result) {
    auto pool = fixtures::feasible_pool();
    operators::RandomLineupGenerator generator;
    std::mt19937 rng(42);

    bool all_valid = true;
    bool all_slots_in_role = true;
    bool totals_match = true;
    for (int i = 0; i < 200; ++i) {
        const auto lineup = generator.generate(pool, rng);

        all_valid = all_valid && lineup.salary < 50000 &&
                    LineupValidator::distinct_teams(lineup.players) >= 3 &&
                    LineupValidator::distinct_players(lineup.players) == 9;

        for (std::size_t slot = 0; slot < lineup.players.size(); ++slot) {
            all_slots_in_role = all_slots_in_role &&
                                in_group(pool, problems::slot_group(slot), lineup.players[slot]);
        }

        totals_match = totals_match &&
                       lineup.salary == LineupValidator::total_salary(lineup.players) &&
                       lineup.projection == LineupValidator::total_projection(lineup.players);
    }

    result.assert_true(all_valid, "Every generated lineup satisfies cap, teams and uniqueness");
    result.assert_true(all_slots_in_role, "Every slot drawn from its role sequence");
    result.assert_true(totals_match, "Appended salary and projection match the players");
}

void test_utility_slot_never_goalie(TestResult& result) {
    auto pool = fixtures::feasible_pool();
    operators::RandomLineupGenerator generator;
    std::mt19937 rng(7);

    bool no_goalie = true;
    for (int i = 0; i < 100; ++i) {
        const auto lineup = generator.generate(pool, rng);
        no_goalie = no_goalie && lineup.players[8]->position != problems::Position::Goalie;
    }
    result.assert_true(no_goalie, "Utility slot never holds a goalie");
}

void test_single_team_pool_exhausts_attempts(TestResult& result) {
    auto pool = fixtures::single_team_pool();
    operators::RandomLineupGenerator generator(problems::LineupRules{}, 500);
    std::mt19937 rng(1);

    result.assert_false(generator.try_generate(pool, rng).has_value(),
                        "try_generate gives up on a single-team pool");
    result.assert_throws<operators::NoFeasibleLineupError>(
        [&] { (void)generator.generate(pool, rng); },
        "generate throws once the attempt ceiling is reached");

    // Every raw draw fails the team check
    bool all_rejected = true;
    for (int i = 0; i < 100; ++i) {
        all_rejected = all_rejected && !generator.validator().validate(generator.draw(pool, rng));
    }
    result.assert_true(all_rejected, "Every single-team candidate is rejected");
}

void test_missing_role_fails_fast(TestResult& result) {
    auto players = fixtures::feasible_players();
    std::erase_if(players, [](const problems::Player& player) {
        return player.position == problems::Position::Goalie;
    });
    auto pool = problems::PlayerPool::from_players(std::move(players));

    operators::RandomLineupGenerator generator;
    std::mt19937 rng(3);

    result.assert_throws<operators::NoFeasibleLineupError>(
        [&] { (void)generator.generate(pool, rng); }, "Pool without goalies is rejected");
    result.assert_false(generator.try_generate(pool, rng).has_value(),
                        "try_generate returns nothing without goalies");
}

void test_generation_is_reproducible(TestResult& result) {
    auto pool = fixtures::feasible_pool();
    operators::RandomLineupGenerator generator;
    std::mt19937 rng_a(99);
    std::mt19937 rng_b(99);

    bool identical = true;
    for (int i = 0; i < 20; ++i) {
        identical = identical &&
                    generator.generate(pool, rng_a).same_players(generator.generate(pool, rng_b));
    }
    result.assert_true(identical, "Same seed yields the same lineups");
}

void test_default_attempt_ceiling(TestResult& result) {
    operators::RandomLineupGenerator generator;
    result.assert_eq(operators::DEFAULT_MAX_ATTEMPTS, generator.max_attempts(),
                     "Default attempt ceiling");
}

int main() {
    std::cout << "=== LineupLab Generator Tests ===\n\n";

    TestResult result;

    test_generated_lineups_satisfy_constraints(result);
    test_utility_slot_never_goalie(result);
    test_single_team_pool_exhausts_attempts(result);
    test_missing_role_fails_fast(result);
    test_generation_is_reproducible(result);
    test_default_attempt_ceiling(result);

    return result.summary();
}
