#pragma once

/// @file lineup.hpp
/// @brief Lineup representation and the salary / team / uniqueness validator

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_set>

#include <lineuplab/problems/roster.hpp>

namespace lineuplab::problems {

/// Nine player references in slot order [C, C, W, W, W, D, D, G, UTIL]
using Slots = std::array<const Player*, LINEUP_SIZE>;

/// A validated lineup: the nine slots followed by total salary and projection
struct Lineup {
    Slots players{};
    int salary = 0; // Below the salary cap once validated
    double projection = 0.0;

    /// Same players in the same slots
    [[nodiscard]] bool same_players(const Lineup& other) const noexcept {
        return players == other.players;
    }
};

/// Contest constraints checked by the validator
struct LineupRules {
    int salary_cap = 50000;    // Total salary must stay strictly below the cap
    std::size_t min_teams = 3; // Minimum number of distinct team codes
};

/// Outcome of a validation check; the first failing constraint wins
enum class Verdict { Accepted, OverSalaryCap, TooFewTeams, DuplicatePlayer };

constexpr std::string_view to_string(Verdict verdict) noexcept {
    switch (verdict) {
    case Verdict::Accepted:
        return "accepted";
    case Verdict::OverSalaryCap:
        return "over salary cap";
    case Verdict::TooFewTeams:
        return "too few teams";
    case Verdict::DuplicatePlayer:
        return "duplicate player";
    }
    return "unknown";
}

/// Round a projection to two decimal places
inline double round_projection(double value) noexcept { return std::round(value * 100.0) / 100.0; }

/// Pure predicate and scorer for candidate lineups
class LineupValidator {
  private:
    LineupRules rules_;

  public:
    LineupValidator() = default;
    explicit LineupValidator(LineupRules rules) : rules_(rules) {}

    [[nodiscard]] const LineupRules& rules() const noexcept { return rules_; }

    /// Total salary of the nine slots, widened so large salaries cannot wrap
    static std::int64_t total_salary(const Slots& slots) noexcept {
        std::int64_t salary = 0;
        for (const Player* player : slots) {
            salary += player->salary;
        }
        return salary;
    }

    /// Total projected points, rounded to two decimals
    static double total_projection(const Slots& slots) noexcept {
        double points = 0.0;
        for (const Player* player : slots) {
            points += player->projected_points;
        }
        return round_projection(points);
    }

    static std::size_t distinct_teams(const Slots& slots) {
        std::unordered_set<std::string_view> teams;
        for (const Player* player : slots) {
            teams.insert(player->team);
        }
        return teams.size();
    }

    /// Distinct player identities (by name)
    static std::size_t distinct_players(const Slots& slots) {
        std::unordered_set<std::string_view> names;
        for (const Player* player : slots) {
            names.insert(player->name);
        }
        return names.size();
    }

    /// Report which constraint, if any, the candidate violates
    [[nodiscard]] Verdict check(const Slots& slots) const {
        if (total_salary(slots) >= rules_.salary_cap)
            return Verdict::OverSalaryCap;
        if (distinct_teams(slots) < rules_.min_teams)
            return Verdict::TooFewTeams;
        if (distinct_players(slots) != LINEUP_SIZE)
            return Verdict::DuplicatePlayer;
        return Verdict::Accepted;
    }

    /// Accept the candidate and append its salary and projection, or reject it
    [[nodiscard]] std::optional<Lineup> validate(const Slots& slots) const {
        if (check(slots) != Verdict::Accepted) {
            return std::nullopt;
        }
        // check() bounded the total below an int cap
        return Lineup{slots, static_cast<int>(total_salary(slots)), total_projection(slots)};
    }
};

} // namespace lineuplab::problems
