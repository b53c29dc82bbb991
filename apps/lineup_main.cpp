#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <lineuplab/lineuplab.hpp>
#include <nlohmann/json.hpp>

using namespace lineuplab;

/// Command-line arguments structure
/// Wraps both the configuration and runtime options
struct CLIConfig {
    std::string config_file;
    std::string roster_file;
    std::size_t num_lineups = 100;
    double duration_seconds = 60.0;
    std::size_t max_rounds = 0;
    std::uint64_t seed = 1;
    bool verbose = false;
    std::string output_file;
    std::string upload_file;
    bool json_output = false;
    std::string json_file;

    // Track which values were explicitly set via command line
    bool has_lineups_override = false;
    bool has_duration_override = false;
    bool has_rounds_override = false;
    bool has_seed_override = false;

    // Convert CLI overrides to configuration overrides
    config::ConfigOverrides to_overrides() const {
        config::ConfigOverrides overrides;
        if (has_lineups_override) {
            overrides.num_lineups = num_lineups;
        }
        if (has_duration_override) {
            overrides.duration_seconds = duration_seconds;
        }
        if (has_rounds_override) {
            overrides.max_rounds = max_rounds;
        }
        if (has_seed_override) {
            overrides.seed = seed;
        }
        if (!roster_file.empty()) {
            overrides.roster_path = roster_file;
        }
        if (!output_file.empty()) {
            overrides.lineups_path = output_file;
        }
        if (!upload_file.empty()) {
            overrides.upload_path = upload_file;
        }
        if (verbose) {
            overrides.verbose = true;
        }
        return overrides;
    }
};

/// Get build configuration info
std::string get_build_config() {
#ifdef NDEBUG
    std::string mode = "Release";
#else
    std::string mode = "Debug";
#endif

#ifdef __clang__
    std::string compiler =
        "Clang " + std::to_string(__clang_major__) + "." + std::to_string(__clang_minor__);
#elif defined(__GNUC__)
    std::string compiler = "GCC " + std::to_string(__GNUC__) + "." + std::to_string(__GNUC_MINOR__);
#elif defined(_MSC_VER)
    std::string compiler = "MSVC " + std::to_string(_MSC_VER);
#else
    std::string compiler = "Unknown";
#endif

    return mode + " (" + compiler + ")";
}

/// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  --config FILE           Load configuration from TOML file\n"
              << "  -r, --roster FILE       Roster CSV (default: DKSalaries.csv)\n"
              << "  -n, --lineups NUM       Lineups to keep (default: 100)\n"
              << "  -d, --duration SECONDS  Search time budget (default: 60)\n"
              << "  --max-rounds NUM        Stop after NUM rounds (default: no limit)\n"
              << "  -s, --seed SEED         Random seed (default: 1)\n"
              << "  -o, --output FILE       Full lineup CSV (default: lineups.csv)\n"
              << "  -u, --upload FILE       Upload CSV (default: lineups_for_upload.csv)\n"
              << "  -v, --verbose           Verbose output\n"
              << "  --json                  Enable JSON output format\n"
              << "  --json-file FILE        Write JSON results to file\n"
              << "\nExamples:\n"
              << "  " << program_name << " --roster DKSalaries.csv --lineups 150\n"
              << "  " << program_name << " --config config/default.toml --duration 30\n"
              << "  " << program_name << " --json --json-file results.json\n";
}

/// Parse command line arguments
CLIConfig parse_args(int argc, char** argv) {
    CLIConfig config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "--config" && i + 1 < argc) {
            config.config_file = argv[++i];
        } else if ((arg == "-r" || arg == "--roster") && i + 1 < argc) {
            config.roster_file = argv[++i];
        } else if ((arg == "-n" || arg == "--lineups") && i + 1 < argc) {
            config.num_lineups = std::stoull(argv[++i]);
            config.has_lineups_override = true;
        } else if ((arg == "-d" || arg == "--duration") && i + 1 < argc) {
            config.duration_seconds = std::stod(argv[++i]);
            config.has_duration_override = true;
        } else if (arg == "--max-rounds" && i + 1 < argc) {
            config.max_rounds = std::stoull(argv[++i]);
            config.has_rounds_override = true;
        } else if ((arg == "-s" || arg == "--seed") && i + 1 < argc) {
            config.seed = std::stoull(argv[++i]);
            config.has_seed_override = true;
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            config.output_file = argv[++i];
        } else if ((arg == "-u" || arg == "--upload") && i + 1 < argc) {
            config.upload_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--json") {
            config.json_output = true;
        } else if (arg == "--json-file" && i + 1 < argc) {
            config.json_file = argv[++i];
            config.json_output = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }

    return config;
}

/// Names of the nine players in a lineup
nlohmann::json lineup_names(const problems::Lineup& lineup) {
    auto names = nlohmann::json::array();
    for (const auto* player : lineup.players) {
        if (player != nullptr) {
            names.push_back(player->name);
        }
    }
    return names;
}

/// Write JSON output with full metadata
void write_json_output(const core::SearchResult& result, const config::Config& cfg,
                       const problems::PlayerPool& pool, double runtime,
                       const std::string& filename = "") {
    using json = nlohmann::json;

    json output;

    output["metadata"] = {{"version", VERSION},
                          {"build_config", get_build_config()},
                          {"timestamp", std::time(nullptr)},
                          {"runtime_seconds", runtime}};

    output["configuration"] = {{"roster_file", cfg.roster.path},
                               {"num_lineups", cfg.search.num_lineups},
                               {"duration_seconds", cfg.search.duration_seconds},
                               {"max_rounds", cfg.search.max_rounds},
                               {"seed", cfg.search.seed},
                               {"salary_cap", cfg.rules.salary_cap},
                               {"min_teams", cfg.rules.min_teams}};

    json pool_sizes;
    for (const auto& spec : problems::SLOT_TABLE) {
        pool_sizes[std::string(problems::to_string(spec.group))] = pool.group(spec.group).size();
    }
    output["pool"] = {{"active_players", pool.size()}, {"groups", pool_sizes}};

    json results;
    results["rounds"] = result.rounds;
    results["lineups_generated"] = result.lineups_generated;
    results["matings"] = result.matings;
    results["lineups_kept"] = result.lineups.size();
    results["best_projection"] = result.best_fitness.value;
    results["best_salary"] = result.best_lineup.salary;
    results["best_lineup"] = lineup_names(result.best_lineup);
    output["results"] = results;

    // Search history section (last 5 entries)
    json history = json::array();
    auto history_start = result.history.size() > 5 ? result.history.size() - 5 : 0;
    for (size_t i = history_start; i < result.history.size(); ++i) {
        const auto& stats = result.history[i];
        history.push_back({{"round", stats.round},
                           {"best_projection", stats.best_fitness.value},
                           {"population_size", stats.population_size},
                           {"elapsed_ms", stats.elapsed_time.count()}});
    }
    output["search_history"] = history;

    if (!filename.empty()) {
        std::ofstream file(filename);
        if (file) {
            file << output.dump(2);
        } else {
            std::cerr << "Could not open JSON output file: " << filename << "\n";
        }
    } else {
        std::cout << output.dump(2) << "\n";
    }
}

/// Print statistics
void print_stats(const core::SearchResult& result, bool verbose, double runtime) {
    std::cout << "\n=== Results ===\n";
    std::cout << "Best projection: " << std::fixed << std::setprecision(2)
              << result.best_fitness.value << "\n";
    std::cout << "Best salary: " << result.best_lineup.salary << "\n";
    std::cout << "Rounds: " << result.rounds << "\n";
    std::cout << "Lineups generated: " << result.lineups_generated << "\n";
    std::cout << "Matings: " << result.matings << "\n";
    std::cout << "Lineups kept: " << result.lineups.size() << "\n";
    std::cout << "Runtime: " << std::fixed << std::setprecision(3) << runtime << " seconds\n";

    if (verbose && !result.history.empty()) {
        std::cout << "\n=== Search History ===\n";
        std::cout << std::setw(10) << "Round" << std::setw(15) << "Best" << std::setw(15)
                  << "Population" << std::setw(12) << "Time(ms)\n";
        std::cout << std::string(52, '-') << "\n";

        for (const auto& stats : result.history) {
            std::cout << std::setw(10) << stats.round << std::setw(15) << std::fixed
                      << std::setprecision(2) << stats.best_fitness.value << std::setw(15)
                      << stats.population_size << std::setw(12) << stats.elapsed_time.count()
                      << "\n";
        }
    }
}

int main(int argc, char** argv) {
    try {
        auto cli_config = parse_args(argc, argv);

        if (!cli_config.json_output) {
            std::cout << "LineupLab v" << VERSION << "\n";
            std::cout << std::string(30, '=') << "\n";
        }

        // Load or create configuration
        config::Config cfg;
        if (!cli_config.config_file.empty()) {
            if (!cli_config.json_output) {
                std::cout << "Loading configuration from: " << cli_config.config_file << "\n";
            }
            cfg = config::Config::from_file(cli_config.config_file);
        }
        cfg.apply_overrides(cli_config.to_overrides());

        if (!cli_config.json_output) {
            std::cout << "Loading roster: " << cfg.roster.path << "\n";
        }
        auto pool = io::RosterParser::parse_file(cfg.roster.path, cfg.roster_layout());

        const auto search_config = cfg.to_search_config();

        if (!cli_config.json_output) {
            std::cout << "Active players: " << pool.size() << " (G " << pool.goalies().size()
                      << ", C " << pool.centers().size() << ", W " << pool.wingers().size()
                      << ", D " << pool.defensemen().size() << ", UTIL "
                      << pool.utility().size() << ")\n";
            std::cout << "Lineups: " << search_config.num_lineups << "\n";
            std::cout << "Duration: " << cfg.search.duration_seconds << " seconds\n";
            std::cout << "Seed: " << search_config.seed << "\n\n";
            std::cout << "Starting search...\n";
        }
        auto start_time = std::chrono::steady_clock::now();

        auto search = factory::make_search_from_config(cfg);
        auto result = search.run(pool, search_config);

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration<double>(end_time - start_time).count();

        if (cli_config.json_output) {
            write_json_output(result, cfg, pool, duration, cli_config.json_file);
        } else {
            print_stats(result, cfg.logging.verbose, duration);
        }

        io::LineupWriter::write_full(cfg.output.lineups_path, result.lineups.genomes());
        io::LineupWriter::write_upload(cfg.output.upload_path, result.lineups.genomes());

        if (!cli_config.json_output) {
            std::cout << "Lineups written to: " << cfg.output.lineups_path << "\n";
            std::cout << "Upload file written to: " << cfg.output.upload_path << "\n";
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
