#pragma once

/// @file roster.hpp
/// @brief Player records, role groups and the player pool used by the lineup search
///
/// The pool owns every active player. Lineups refer to players through `const Player*`,
/// so a pool must outlive every lineup drawn from it and is therefore move-only.

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lineuplab::problems {

/// Stored position of a player
enum class Position {
    Goalie,    // G
    Center,    // C
    Winger,    // W
    Defenseman // D
};

/// Lineup role groups in slot order; Utility accepts any non-goalie
enum class RoleGroup { Center, Winger, Defenseman, Goalie, Utility };

inline constexpr std::size_t ROLE_GROUP_COUNT = 5;
inline constexpr std::size_t LINEUP_SIZE = 9;

/// One row of the slot table: how many slots a group fills and where they start
struct SlotSpec {
    RoleGroup group;
    std::size_t count;
    std::size_t first_slot;
};

/// Slot layout [C, C, W, W, W, D, D, G, UTIL]
inline constexpr std::array<SlotSpec, ROLE_GROUP_COUNT> SLOT_TABLE = {{
    {RoleGroup::Center, 2, 0},
    {RoleGroup::Winger, 3, 2},
    {RoleGroup::Defenseman, 2, 5},
    {RoleGroup::Goalie, 1, 7},
    {RoleGroup::Utility, 1, 8},
}};

/// Header labels of the nine lineup slots
inline constexpr std::array<std::string_view, LINEUP_SIZE> SLOT_LABELS = {
    "C", "C", "W", "W", "W", "D", "D", "G", "UTIL"};

/// Role group that fills the given slot
constexpr RoleGroup slot_group(std::size_t slot) noexcept {
    for (const auto& spec : SLOT_TABLE) {
        if (slot >= spec.first_slot && slot < spec.first_slot + spec.count) {
            return spec.group;
        }
    }
    return RoleGroup::Utility;
}

constexpr std::string_view to_string(RoleGroup group) noexcept {
    switch (group) {
    case RoleGroup::Center:
        return "center";
    case RoleGroup::Winger:
        return "winger";
    case RoleGroup::Defenseman:
        return "defenseman";
    case RoleGroup::Goalie:
        return "goalie";
    case RoleGroup::Utility:
        return "utility";
    }
    return "unknown";
}

/// Map a roster role code (first character of the position descriptor) to a position
constexpr std::optional<Position> position_from_code(char code) noexcept {
    switch (code) {
    case 'G':
        return Position::Goalie;
    case 'C':
        return Position::Center;
    case 'W':
        return Position::Winger;
    case 'D':
        return Position::Defenseman;
    default:
        return std::nullopt;
    }
}

/// A rostered player
struct Player {
    std::string name; // Identity key
    Position position = Position::Center;
    int salary = 0;
    std::string team;
    double projected_points = 0.0;
};

/// Categorized collection of active players
class PlayerPool {
  public:
    using Sequence = std::vector<const Player*>;

  private:
    std::vector<Player> players_;
    std::array<Sequence, ROLE_GROUP_COUNT> groups_;

  public:
    PlayerPool() = default;

    /// Build a pool from loaded records
    ///
    /// Players projected at exactly zero points are treated as inactive and dropped.
    /// Every non-goalie is also appended to the utility sequence.
    static PlayerPool from_players(std::vector<Player> players) {
        PlayerPool pool;
        pool.players_.reserve(players.size());
        for (auto& player : players) {
            if (player.projected_points != 0.0) {
                pool.players_.push_back(std::move(player));
            }
        }

        // Addresses are stable from here on: players_ is never resized again
        for (const auto& player : pool.players_) {
            switch (player.position) {
            case Position::Goalie:
                pool.group_ref(RoleGroup::Goalie).push_back(&player);
                break;
            case Position::Center:
                pool.group_ref(RoleGroup::Center).push_back(&player);
                break;
            case Position::Winger:
                pool.group_ref(RoleGroup::Winger).push_back(&player);
                break;
            case Position::Defenseman:
                pool.group_ref(RoleGroup::Defenseman).push_back(&player);
                break;
            }

            if (player.position != Position::Goalie) {
                pool.group_ref(RoleGroup::Utility).push_back(&player);
            }
        }
        return pool;
    }

    // Lineups hold pointers into players_; a copy would leave them dangling
    PlayerPool(const PlayerPool&) = delete;
    PlayerPool& operator=(const PlayerPool&) = delete;
    PlayerPool(PlayerPool&&) noexcept = default;
    PlayerPool& operator=(PlayerPool&&) noexcept = default;

    /// Players eligible for the given role group
    [[nodiscard]] std::span<const Player* const> group(RoleGroup group) const noexcept {
        const auto& seq = groups_[static_cast<std::size_t>(group)];
        return {seq.data(), seq.size()};
    }

    [[nodiscard]] std::span<const Player* const> goalies() const noexcept {
        return group(RoleGroup::Goalie);
    }
    [[nodiscard]] std::span<const Player* const> centers() const noexcept {
        return group(RoleGroup::Center);
    }
    [[nodiscard]] std::span<const Player* const> wingers() const noexcept {
        return group(RoleGroup::Winger);
    }
    [[nodiscard]] std::span<const Player* const> defensemen() const noexcept {
        return group(RoleGroup::Defenseman);
    }
    [[nodiscard]] std::span<const Player* const> utility() const noexcept {
        return group(RoleGroup::Utility);
    }

    /// All active players in load order
    [[nodiscard]] const std::vector<Player>& players() const noexcept { return players_; }

    /// Number of active players
    [[nodiscard]] std::size_t size() const noexcept { return players_.size(); }

    [[nodiscard]] bool empty() const noexcept { return players_.empty(); }

    /// True when every role group has at least one candidate
    [[nodiscard]] bool covers_all_groups() const noexcept {
        for (const auto& seq : groups_) {
            if (seq.empty())
                return false;
        }
        return true;
    }

    /// Look up an active player by name
    [[nodiscard]] const Player* find(std::string_view name) const noexcept {
        for (const auto& player : players_) {
            if (player.name == name)
                return &player;
        }
        return nullptr;
    }

  private:
    Sequence& group_ref(RoleGroup group) noexcept {
        return groups_[static_cast<std::size_t>(group)];
    }
};

} // namespace lineuplab::problems
