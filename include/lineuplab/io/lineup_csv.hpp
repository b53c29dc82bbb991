#pragma once

#include <cstddef>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <lineuplab/problems/lineup.hpp>
#include <lineuplab/problems/roster.hpp>

namespace lineuplab::io {

/// CSV output of final lineups
///
/// Two files are produced: a full file with salary and projection columns, and an
/// upload file with the nine player columns only.
class LineupWriter {
  public:
    /// Write the full lineup file (header C..UTIL,Salary,Projection)
    /// @throws std::runtime_error if the file cannot be written
    static void write_full(const std::string& filename,
                           std::span<const problems::Lineup> lineups);

    /// Write the upload-ready file (header C..UTIL, adjacent duplicates removed)
    /// @throws std::runtime_error if the file cannot be written
    static void write_upload(const std::string& filename,
                             std::span<const problems::Lineup> lineups);

    static void format_full(std::ostream& out, std::span<const problems::Lineup> lineups);
    static void format_upload(std::ostream& out, std::span<const problems::Lineup> lineups);

    /// Drop every lineup whose players equal those of the following lineup
    ///
    /// Only neighbours are compared, so duplicates are caught when the input is ranked by
    /// score and equal lineups sit next to each other. The last lineup is always kept.
    static std::vector<problems::Lineup>
    drop_adjacent_duplicates(std::span<const problems::Lineup> lineups);

  private:
    static void write_header(std::ostream& out, bool with_totals);
    static void write_players(std::ostream& out, const problems::Lineup& lineup);
    static std::string escape(std::string_view cell);
    static std::string format_projection(double projection);
    static std::ofstream open_for_write(const std::string& filename);
    static void finish(std::ofstream& file, const std::string& filename);
};

// Implementation

inline void LineupWriter::write_full(const std::string& filename,
                                     std::span<const problems::Lineup> lineups) {
    auto file = open_for_write(filename);
    format_full(file, lineups);
    finish(file, filename);
}

inline void LineupWriter::write_upload(const std::string& filename,
                                       std::span<const problems::Lineup> lineups) {
    auto file = open_for_write(filename);
    format_upload(file, lineups);
    finish(file, filename);
}

inline void LineupWriter::format_full(std::ostream& out,
                                      std::span<const problems::Lineup> lineups) {
    write_header(out, true);
    for (const auto& lineup : lineups) {
        write_players(out, lineup);
        out << ',' << lineup.salary << ',' << format_projection(lineup.projection) << '\n';
    }
}

inline void LineupWriter::format_upload(std::ostream& out,
                                        std::span<const problems::Lineup> lineups) {
    write_header(out, false);
    for (const auto& lineup : drop_adjacent_duplicates(lineups)) {
        write_players(out, lineup);
        out << '\n';
    }
}

inline std::vector<problems::Lineup>
LineupWriter::drop_adjacent_duplicates(std::span<const problems::Lineup> lineups) {
    std::vector<problems::Lineup> kept;
    kept.reserve(lineups.size());
    for (std::size_t i = 0; i < lineups.size(); ++i) {
        if (i + 1 < lineups.size() && lineups[i].same_players(lineups[i + 1]))
            continue;
        kept.push_back(lineups[i]);
    }
    return kept;
}

inline void LineupWriter::write_header(std::ostream& out, bool with_totals) {
    for (std::size_t i = 0; i < problems::SLOT_LABELS.size(); ++i) {
        if (i > 0)
            out << ',';
        out << problems::SLOT_LABELS[i];
    }
    if (with_totals) {
        out << ",Salary,Projection";
    }
    out << '\n';
}

inline void LineupWriter::write_players(std::ostream& out, const problems::Lineup& lineup) {
    for (std::size_t i = 0; i < lineup.players.size(); ++i) {
        if (i > 0)
            out << ',';
        out << escape(lineup.players[i]->name);
    }
}

inline std::string LineupWriter::escape(std::string_view cell) {
    if (cell.find_first_of(",\"\n") == std::string_view::npos) {
        return std::string(cell);
    }
    std::string quoted = "\"";
    for (const char c : cell) {
        if (c == '"')
            quoted.push_back('"');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

// Formatted on a local stream so the caller's stream state is left alone
inline std::string LineupWriter::format_projection(double projection) {
    std::ostringstream text;
    text << std::fixed << std::setprecision(2) << projection;
    return text.str();
}

inline std::ofstream LineupWriter::open_for_write(const std::string& filename) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot create lineup file: " + filename);
    }
    return file;
}

inline void LineupWriter::finish(std::ofstream& file, const std::string& filename) {
    file.flush();
    if (!file) {
        throw std::runtime_error("Failed writing lineup file: " + filename);
    }
}

} // namespace lineuplab::io
