#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "racetrack/core/race_controller.hpp"
#include "racetrack/core/track_loader.hpp"
#include "racetrack/utils/logging.hpp"

namespace {

const char* LOG_CATEGORY = "cli";

void print_usage(const char* exe) {
    std::cout <<
R"(Racetrack headless race

Usage:
  )" << exe << R"( <track_file> [options]

Options:
  -h, --help             Show this help and exit
  --max-turns <n>        Maximum number of turns (default: 1000)
  --max-depth <n>        Maximum search depth (default: 500)
  --max-states <n>       Maximum number of search states (default: 50000)
  --log-level <level>    debug, info, warn, error or fatal (default: info)
  --log-file <path>      Also write log messages to a file
)";
}

int parse_positive_int(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    if (consumed != value.size() || parsed <= 0) {
        throw std::invalid_argument("Invalid value for " + option + ": " + value);
    }
    return parsed;
}

// 設定を返す（ヘルプ表示時はstd::nullopt）
std::optional<racetrack::RaceConfig> parse_args(int argc, char** argv) {
    racetrack::RaceConfig config;

    auto next_value = [&](const std::string& option, int& i) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + option);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return std::nullopt;
        } else if (arg == "--max-turns") {
            config.max_turns = parse_positive_int(arg, next_value(arg, i));
        } else if (arg == "--max-depth") {
            config.search.max_depth = parse_positive_int(arg, next_value(arg, i));
        } else if (arg == "--max-states") {
            config.search.max_states =
                static_cast<std::size_t>(parse_positive_int(arg, next_value(arg, i)));
        } else if (arg == "--log-level") {
            config.log_level = next_value(arg, i);
        } else if (arg == "--log-file") {
            config.log_file = next_value(arg, i);
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unrecognized option: " + arg);
        } else if (config.track_file.empty()) {
            config.track_file = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (config.track_file.empty()) {
        throw std::invalid_argument("Missing track file");
    }
    return config;
}

void configure_logging(const racetrack::RaceConfig& config) {
    auto& logger = racetrack::logging::Logger::instance();
    auto level = racetrack::logging::parse_level(config.log_level);
    if (!level) {
        throw std::invalid_argument("Unknown log level: " + config.log_level);
    }
    logger.set_level(*level);
    if (!config.log_file.empty()) {
        logger.add_file_sink(config.log_file);
    }
}

int run_race(const racetrack::RaceConfig& config) {
    using namespace racetrack;

    TrackLayout layout = load_track_file(config.track_file);
    RaceController controller(TurnEngine(std::move(layout.grid), std::move(layout.vehicles)));

    for (std::size_t i = 0; i < controller.engine().vehicle_count(); ++i) {
        const SearchResult search = controller.assign_path_search(i, config.search);
        if (!search.found()) {
            std::cout << "Vehicle " << controller.engine().vehicle(i).id()
                      << " has no plan (" << to_string(search.status) << "), holding still"
                      << std::endl;
        }
    }

    const RaceResult result = controller.run(config.max_turns);
    const TurnEngine& engine = controller.engine();

    RACETRACK_LOG_INFO(LOG_CATEGORY, logging::format_string(
        "Final board:\n%s", render_race(engine.grid(), engine.vehicles()).c_str()));

    if (result.winner) {
        std::cout << "Winner: " << engine.vehicle(*result.winner).id()
                  << " after " << result.turns << " turns" << std::endl;
    } else {
        std::cout << "No winner (" << to_string(result.status) << ") after "
                  << result.turns << " turns" << std::endl;
    }

    const auto stats = controller.get_stats();
    RACETRACK_LOG_INFO(LOG_CATEGORY, logging::format_string(
        "Searches: %.0f (failed %.0f), states explored: %.0f, search time: %.2f ms",
        stats.at("searches"), stats.at("search_failures"),
        stats.at("states_explored"), stats.at("search_time_ms")));
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    int exit_code = 0;
    try {
        const auto config = parse_args(argc, argv);
        if (config) {
            configure_logging(*config);
            exit_code = run_race(*config);
        }
    } catch (const racetrack::TrackFormatError& e) {
        std::cerr << "Track format error (" << racetrack::to_string(e.type()) << "): "
                  << e.what() << std::endl;
        exit_code = 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        exit_code = 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    racetrack::logging::Logger::instance().flush();
    return exit_code;
}
