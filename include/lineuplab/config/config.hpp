#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <toml.hpp>

#include <lineuplab/io/roster_csv.hpp>
#include <lineuplab/operators/generation.hpp>
#include <lineuplab/problems/lineup.hpp>

namespace lineuplab::core {
struct SearchConfig; // Forward declaration
}

namespace lineuplab::config {

/// Custom exception for configuration validation errors
class ConfigValidationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Longest accepted search budget (30 days)
inline constexpr double MAX_DURATION_SECONDS = 30.0 * 24.0 * 3600.0;

/// Search budget and output size
struct SearchSection {
    std::size_t num_lineups = 100;  // Lineups kept after the final trim
    double duration_seconds = 60.0; // Wall-clock budget
    std::size_t max_rounds = 0;     // 0 = run until the time budget is spent
    std::uint64_t seed = 1;         // Reproducible seed by default
    std::size_t max_attempts = operators::DEFAULT_MAX_ATTEMPTS; // Redraws per lineup
};

/// Contest constraints
struct RulesSection {
    int salary_cap = 50000;
    std::size_t min_teams = 3;
};

/// Roster source and column layout
struct RosterSection {
    std::string path = "DKSalaries.csv";
    io::RosterLayout layout;
};

/// Output file locations
struct OutputSection {
    std::string lineups_path = "lineups.csv";
    std::string upload_path = "lineups_for_upload.csv";
};

/// Console output
struct LoggingSection {
    bool verbose = false;
    std::size_t log_interval = 100; // Record a history entry every N rounds
};

/// Command-line override structure
/// Contains optional overrides for configuration parameters
struct ConfigOverrides {
    std::optional<std::size_t> num_lineups;
    std::optional<double> duration_seconds;
    std::optional<std::size_t> max_rounds;
    std::optional<std::uint64_t> seed;
    std::optional<std::string> roster_path;
    std::optional<std::string> lineups_path;
    std::optional<std::string> upload_path;
    std::optional<bool> verbose;
};

/// Complete configuration structure
struct Config {
    SearchSection search;
    RulesSection rules;
    RosterSection roster;
    OutputSection output;
    LoggingSection logging;

    /// Load configuration from TOML file
    /// Validates all parameters and applies defaults for missing values
    static Config from_file(const std::string& filepath);

    /// Load configuration from TOML string
    static Config from_string(const std::string& toml_string);

    /// Validate configuration parameters
    /// Throws ConfigValidationError if any parameter is invalid
    void validate() const;

    /// Export configuration to TOML string
    std::string to_toml() const;

    /// Convert to core::SearchConfig for the evolution loop
    core::SearchConfig to_search_config() const;

    /// Validator constraints
    problems::LineupRules lineup_rules() const {
        return problems::LineupRules{rules.salary_cap, rules.min_teams};
    }

    /// Roster column layout
    const io::RosterLayout& roster_layout() const noexcept { return roster.layout; }

    /// Apply command-line overrides to configuration
    /// Overrides take precedence over loaded values
    void apply_overrides(const ConfigOverrides& overrides);

  private:
    static Config from_value(const toml::value& data);

    static SearchSection parse_search(const toml::value& data);
    static RulesSection parse_rules(const toml::value& data);
    static RosterSection parse_roster(const toml::value& data);
    static OutputSection parse_output(const toml::value& data);
    static LoggingSection parse_logging(const toml::value& data);
};

// Implementation of Config methods

inline Config Config::from_file(const std::string& filepath) {
    return from_value(toml::parse(filepath));
}

inline Config Config::from_string(const std::string& toml_string) {
    std::istringstream iss(toml_string);
    return from_value(toml::parse(iss, "config_string"));
}

inline Config Config::from_value(const toml::value& data) {
    Config config;

    // Parse each section if it exists, otherwise use defaults
    if (data.contains("search")) {
        config.search = parse_search(data);
    }

    if (data.contains("rules")) {
        config.rules = parse_rules(data);
    }

    if (data.contains("roster")) {
        config.roster = parse_roster(data);
    }

    if (data.contains("output")) {
        config.output = parse_output(data);
    }

    if (data.contains("logging")) {
        config.logging = parse_logging(data);
    }

    config.validate();
    return config;
}

inline void Config::validate() const {
    if (search.num_lineups == 0) {
        throw ConfigValidationError("Number of lineups must be positive");
    }

    if (!std::isfinite(search.duration_seconds)) {
        throw ConfigValidationError("Search duration must be a finite number of seconds");
    }

    if (search.duration_seconds < 0.0) {
        throw ConfigValidationError("Search duration cannot be negative");
    }

    if (search.duration_seconds > MAX_DURATION_SECONDS) {
        throw ConfigValidationError("Search duration cannot exceed 30 days");
    }

    if (search.max_attempts == 0) {
        throw ConfigValidationError("Max attempts must be positive");
    }

    if (rules.salary_cap <= 0) {
        throw ConfigValidationError("Salary cap must be positive");
    }

    if (rules.min_teams == 0 || rules.min_teams > problems::LINEUP_SIZE) {
        throw ConfigValidationError("Minimum teams must be in [1,9]");
    }

    if (roster.path.empty()) {
        throw ConfigValidationError("Roster path cannot be empty");
    }

    // Each mapped field needs its own column
    const auto& layout = roster.layout;
    const std::vector<std::size_t> columns = {layout.name_column, layout.position_column,
                                              layout.salary_column, layout.team_column,
                                              layout.points_column};
    for (std::size_t i = 0; i < columns.size(); ++i) {
        for (std::size_t j = i + 1; j < columns.size(); ++j) {
            if (columns[i] == columns[j]) {
                throw ConfigValidationError("Roster columns must be distinct (column " +
                                            std::to_string(columns[i]) + " mapped twice)");
            }
        }
    }

    if (output.lineups_path.empty() || output.upload_path.empty()) {
        throw ConfigValidationError("Output paths cannot be empty");
    }

    if (logging.log_interval == 0) {
        throw ConfigValidationError("Log interval must be positive");
    }
}

inline SearchSection Config::parse_search(const toml::value& data) {
    SearchSection search;
    const auto& search_table = toml::find(data, "search");

    if (search_table.contains("num_lineups")) {
        search.num_lineups = toml::find<std::size_t>(search_table, "num_lineups");
    }

    if (search_table.contains("duration_seconds")) {
        // Handle both integer and floating-point values for the duration
        const auto& duration_val = search_table.at("duration_seconds");
        if (duration_val.is_integer()) {
            search.duration_seconds =
                static_cast<double>(toml::find<std::int64_t>(search_table, "duration_seconds"));
        } else {
            search.duration_seconds = toml::find<double>(search_table, "duration_seconds");
        }
    }

    if (search_table.contains("max_rounds")) {
        search.max_rounds = toml::find<std::size_t>(search_table, "max_rounds");
    }

    if (search_table.contains("seed")) {
        search.seed = toml::find<std::uint64_t>(search_table, "seed");
    }

    if (search_table.contains("max_attempts")) {
        search.max_attempts = toml::find<std::size_t>(search_table, "max_attempts");
    }

    return search;
}

inline RulesSection Config::parse_rules(const toml::value& data) {
    RulesSection rules;
    const auto& rules_table = toml::find(data, "rules");

    if (rules_table.contains("salary_cap")) {
        rules.salary_cap = toml::find<int>(rules_table, "salary_cap");
    }

    if (rules_table.contains("min_teams")) {
        rules.min_teams = toml::find<std::size_t>(rules_table, "min_teams");
    }

    return rules;
}

inline RosterSection Config::parse_roster(const toml::value& data) {
    RosterSection roster;
    const auto& roster_table = toml::find(data, "roster");

    if (roster_table.contains("path")) {
        roster.path = toml::find<std::string>(roster_table, "path");
    }

    if (roster_table.contains("header_rows")) {
        roster.layout.header_rows = toml::find<std::size_t>(roster_table, "header_rows");
    }

    if (roster_table.contains("name_column")) {
        roster.layout.name_column = toml::find<std::size_t>(roster_table, "name_column");
    }

    if (roster_table.contains("position_column")) {
        roster.layout.position_column = toml::find<std::size_t>(roster_table, "position_column");
    }

    if (roster_table.contains("salary_column")) {
        roster.layout.salary_column = toml::find<std::size_t>(roster_table, "salary_column");
    }

    if (roster_table.contains("team_column")) {
        roster.layout.team_column = toml::find<std::size_t>(roster_table, "team_column");
    }

    if (roster_table.contains("points_column")) {
        roster.layout.points_column = toml::find<std::size_t>(roster_table, "points_column");
    }

    return roster;
}

inline OutputSection Config::parse_output(const toml::value& data) {
    OutputSection output;
    const auto& output_table = toml::find(data, "output");

    if (output_table.contains("lineups_path")) {
        output.lineups_path = toml::find<std::string>(output_table, "lineups_path");
    }

    if (output_table.contains("upload_path")) {
        output.upload_path = toml::find<std::string>(output_table, "upload_path");
    }

    return output;
}

inline LoggingSection Config::parse_logging(const toml::value& data) {
    LoggingSection log;
    const auto& log_table = toml::find(data, "logging");

    if (log_table.contains("verbose")) {
        log.verbose = toml::find<bool>(log_table, "verbose");
    }

    if (log_table.contains("log_interval")) {
        log.log_interval = toml::find<std::size_t>(log_table, "log_interval");
    }

    return log;
}

inline std::string Config::to_toml() const {
    toml::value root;

    toml::value search_table;
    search_table["num_lineups"] = search.num_lineups;
    search_table["duration_seconds"] = search.duration_seconds;
    search_table["max_rounds"] = search.max_rounds;
    search_table["seed"] = search.seed;
    search_table["max_attempts"] = search.max_attempts;
    root["search"] = search_table;

    toml::value rules_table;
    rules_table["salary_cap"] = rules.salary_cap;
    rules_table["min_teams"] = rules.min_teams;
    root["rules"] = rules_table;

    toml::value roster_table;
    roster_table["path"] = roster.path;
    roster_table["header_rows"] = roster.layout.header_rows;
    roster_table["name_column"] = roster.layout.name_column;
    roster_table["position_column"] = roster.layout.position_column;
    roster_table["salary_column"] = roster.layout.salary_column;
    roster_table["team_column"] = roster.layout.team_column;
    roster_table["points_column"] = roster.layout.points_column;
    root["roster"] = roster_table;

    toml::value output_table;
    output_table["lineups_path"] = output.lineups_path;
    output_table["upload_path"] = output.upload_path;
    root["output"] = output_table;

    toml::value log_table;
    log_table["verbose"] = logging.verbose;
    log_table["log_interval"] = logging.log_interval;
    root["logging"] = log_table;

    std::stringstream ss;
    ss << toml::format(root);
    return ss.str();
}

inline void Config::apply_overrides(const ConfigOverrides& overrides) {
    // Apply overrides only if they are set
    if (overrides.num_lineups.has_value()) {
        search.num_lineups = overrides.num_lineups.value();
    }

    if (overrides.duration_seconds.has_value()) {
        search.duration_seconds = overrides.duration_seconds.value();
    }

    if (overrides.max_rounds.has_value()) {
        search.max_rounds = overrides.max_rounds.value();
    }

    if (overrides.seed.has_value()) {
        search.seed = overrides.seed.value();
    }

    if (overrides.roster_path.has_value()) {
        roster.path = overrides.roster_path.value();
    }

    if (overrides.lineups_path.has_value()) {
        output.lineups_path = overrides.lineups_path.value();
    }

    if (overrides.upload_path.has_value()) {
        output.upload_path = overrides.upload_path.value();
    }

    if (overrides.verbose.has_value()) {
        logging.verbose = overrides.verbose.value();
    }

    // Re-validate after applying overrides
    validate();
}

} // namespace lineuplab::config

// Implementation that depends on core::SearchConfig
// Must be after namespace closing to access lineuplab::core
#include <lineuplab/core/ga.hpp>

namespace lineuplab::config {

inline core::SearchConfig Config::to_search_config() const {
    core::SearchConfig search_config;

    search_config.num_lineups = search.num_lineups;
    search_config.max_rounds = search.max_rounds;
    search_config.seed = search.seed;
    search_config.log_interval = logging.log_interval;

    // Convert duration from seconds to milliseconds
    search_config.time_limit = std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(search.duration_seconds * 1000));

    return search_config;
}

} // namespace lineuplab::config
