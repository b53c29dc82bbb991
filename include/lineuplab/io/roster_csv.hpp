#pragma once

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <fstream>
#include <istream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <lineuplab/problems/roster.hpp>

namespace lineuplab::io {

/// Missing, truncated or malformed roster source
class LoadError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Column layout of a roster export (0-based column indices)
///
/// Defaults match the DraftKings salary download, whose first eight rows carry
/// instructions and the header.
struct RosterLayout {
    std::size_t header_rows = 8;
    std::size_t name_column = 11;
    std::size_t position_column = 14; // Role code is the first character
    std::size_t salary_column = 15;
    std::size_t team_column = 17;
    std::size_t points_column = 18;

    /// Number of columns a record needs to cover every mapped field
    [[nodiscard]] std::size_t required_columns() const noexcept {
        return std::max({name_column, position_column, salary_column, team_column,
                         points_column}) +
               1;
    }
};

/// Split one CSV record; quoted fields may hold commas and doubled quotes
inline std::vector<std::string> split_csv_record(std::string_view line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field.push_back('"');
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else if (c != '\r') {
            field.push_back(c);
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

/// Parser for roster CSV exports
class RosterParser {
  public:
    /// @throws LoadError if the file is missing or malformed
    static problems::PlayerPool parse_file(const std::string& filename,
                                           const RosterLayout& layout = {});
    static problems::PlayerPool parse_string(const std::string& content,
                                             const RosterLayout& layout = {});
    static problems::PlayerPool parse_stream(std::istream& stream,
                                             const RosterLayout& layout = {});

    /// Read player records without building a pool (zero-point players are kept)
    static std::vector<problems::Player> read_players(std::istream& stream,
                                                      const RosterLayout& layout = {});

  private:
    static problems::Player parse_record(const std::vector<std::string>& fields,
                                         const RosterLayout& layout, std::size_t line_number);

    static std::string_view trim(std::string_view value);

    template <typename T>
    static T parse_number(std::string_view text, const char* field_name,
                          std::size_t line_number);
};

// Implementation

inline problems::PlayerPool RosterParser::parse_file(const std::string& filename,
                                                     const RosterLayout& layout) {
    std::ifstream file(filename);
    if (!file) {
        throw LoadError("Cannot open roster file: " + filename);
    }
    return parse_stream(file, layout);
}

inline problems::PlayerPool RosterParser::parse_string(const std::string& content,
                                                       const RosterLayout& layout) {
    std::istringstream stream(content);
    return parse_stream(stream, layout);
}

inline problems::PlayerPool RosterParser::parse_stream(std::istream& stream,
                                                       const RosterLayout& layout) {
    return problems::PlayerPool::from_players(read_players(stream, layout));
}

inline std::vector<problems::Player> RosterParser::read_players(std::istream& stream,
                                                                const RosterLayout& layout) {
    std::string line;
    std::size_t line_number = 0;

    // Instruction and header rows are skipped without inspection
    for (; line_number < layout.header_rows; ++line_number) {
        if (!std::getline(stream, line)) {
            throw LoadError("Roster ended inside the header block (expected " +
                            std::to_string(layout.header_rows) + " header rows)");
        }
    }

    std::vector<problems::Player> players;
    while (std::getline(stream, line)) {
        ++line_number;
        if (trim(line).empty())
            continue;

        const auto fields = split_csv_record(line);
        players.push_back(parse_record(fields, layout, line_number));
    }
    return players;
}

inline problems::Player RosterParser::parse_record(const std::vector<std::string>& fields,
                                                   const RosterLayout& layout,
                                                   std::size_t line_number) {
    if (fields.size() < layout.required_columns()) {
        throw LoadError("Line " + std::to_string(line_number) + ": expected at least " +
                        std::to_string(layout.required_columns()) + " columns, found " +
                        std::to_string(fields.size()));
    }

    problems::Player player;
    player.name = std::string(trim(fields[layout.name_column]));
    player.team = std::string(trim(fields[layout.team_column]));

    const auto descriptor = trim(fields[layout.position_column]);
    const auto position =
        descriptor.empty() ? std::nullopt : problems::position_from_code(descriptor.front());
    if (!position) {
        throw LoadError("Line " + std::to_string(line_number) + ": unknown role code '" +
                        std::string(descriptor) + "'");
    }
    player.position = *position;

    player.salary = parse_number<int>(fields[layout.salary_column], "salary", line_number);
    if (player.salary <= 0) {
        throw LoadError("Line " + std::to_string(line_number) + ": salary must be positive");
    }

    player.projected_points =
        parse_number<double>(fields[layout.points_column], "points", line_number);
    if (player.projected_points < 0.0) {
        throw LoadError("Line " + std::to_string(line_number) +
                        ": projected points cannot be negative");
    }

    return player;
}

inline std::string_view RosterParser::trim(std::string_view value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

template <typename T>
T RosterParser::parse_number(std::string_view text, const char* field_name,
                             std::size_t line_number) {
    const auto value_text = trim(text);
    T value{};
    const auto* end = value_text.data() + value_text.size();
    if (value_text.empty() || std::from_chars(value_text.data(), end, value).ptr != end) {
        throw LoadError("Line " + std::to_string(line_number) + ": invalid " + field_name +
                        " value '" + std::string(value_text) + "'");
    }
    return value;
}

} // namespace lineuplab::io
