// diffjson — compare two JSON documents, or two directories of them
//
// Usage: diffjson [options] <path1> <path2>
//
// Exit status: 0 when everything is identical, 1 when anything differs,
// fails to load, or is missing on one side, 2 on bad arguments.

#include <diffjson-cpp/diffjson.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <system_error>
#include <string>
#include <string_view>
#include <vector>

namespace dj = diffjson_cpp;

namespace {

constexpr int usage_error = 2;

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options] <path1> <path2>\n"
              << "Compare two JSON files or two directories of JSON files.\n"
              << "Options:\n"
              << "  -i, --ignore <accessor>     Field to ignore, e.g. \"['metadata']['timestamp']\".\n"
              << "                              Repeatable; also read whitespace-separated from $"
              << dj::ignore_env_var << "\n"
              << "  -t, --truncate_items <n>    Maximum number of items to output, 0 for all (default "
              << dj::default_max_items << ")\n"
              << "  -v, --verbose               Print the difference report of each differing pair\n"
              << "  -r, --recursive             Pair documents in subdirectories too\n"
              << "      --flat                  One line per difference instead of a nested report\n"
              << "      --moves                 Report array items that only changed position\n"
              << "      --color <auto|always|never>\n"
              << "      --log-level <level>     trace, debug, info, warn, error or off (default warn,\n"
              << "                              or $DIFFJSON_LOG_LEVEL)\n"
              << "  -h, --help                  Show this help\n";
}

auto parse_count(std::string_view text) -> std::optional<std::size_t> {
    auto value = std::size_t{0};
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (text.empty() || ec != std::errc{} || ptr != last) return std::nullopt;
    return value;
}

auto parse_color_mode(std::string_view text) -> std::optional<dj::ColorMode> {
    for (auto mode : {dj::ColorMode::automatic, dj::ColorMode::always, dj::ColorMode::never}) {
        if (text == dj::to_string_view(mode)) return mode;
    }
    return std::nullopt;
}

auto parse_log_level(std::string_view text) -> std::optional<spdlog::level::level_enum> {
    if (text == "warning") return spdlog::level::warn;
    auto level = spdlog::level::from_str(std::string{text});
    // from_str maps unknown names to off
    if (level == spdlog::level::off && text != "off") return std::nullopt;
    return level;
}

void setup_logging(spdlog::level::level_enum level) {
    auto logger = spdlog::stderr_color_mt("diffjson");
    logger->set_pattern("[%l] %v");
    logger->set_level(level);
    spdlog::set_default_logger(logger);
}

}  // namespace

int main(int argc, char** argv) {
    auto options = dj::CompareOptions{};
    auto cli_ignore = std::vector<std::string>{};
    auto positional = std::vector<std::string>{};
    auto log_level = spdlog::level::warn;

    if (const char* env_level = std::getenv("DIFFJSON_LOG_LEVEL")) {
        if (auto level = parse_log_level(env_level)) log_level = *level;
    }

    for (int i = 1; i < argc; ++i) {
        auto arg = std::string{argv[i]};
        auto inline_value = std::optional<std::string>{};
        if (arg.starts_with("--")) {
            if (auto eq = arg.find('='); eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
                arg.resize(eq);
            }
        }
        auto value = [&]() -> std::optional<std::string> {
            if (inline_value) return inline_value;
            if (i + 1 < argc) return std::string{argv[++i]};
            return std::nullopt;
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-i" || arg == "--ignore") {
            auto v = value();
            if (!v) { print_usage(argv[0]); return usage_error; }
            cli_ignore.push_back(*v);
        } else if (arg == "-t" || arg == "--truncate_items" || arg == "--truncate-items") {
            auto v = value();
            auto count = v ? parse_count(*v) : std::nullopt;
            if (!count) {
                std::cerr << "invalid --truncate_items value\n";
                print_usage(argv[0]);
                return usage_error;
            }
            options.truncate_items = *count;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-r" || arg == "--recursive") {
            options.recursive = true;
        } else if (arg == "--flat") {
            options.layout = dj::ReportLayout::flat;
        } else if (arg == "--moves") {
            options.report_moves = true;
        } else if (arg == "--color") {
            auto v = value();
            auto mode = v ? parse_color_mode(*v) : std::nullopt;
            if (!mode) { print_usage(argv[0]); return usage_error; }
            options.color = *mode;
        } else if (arg == "--log-level") {
            auto v = value();
            auto level = v ? parse_log_level(*v) : std::nullopt;
            if (!level) { print_usage(argv[0]); return usage_error; }
            log_level = *level;
        } else if (arg.size() > 1 && arg.front() == '-') {
            std::cerr << "unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return usage_error;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        print_usage(argv[0]);
        return usage_error;
    }
    options.path1 = positional[0];
    options.path2 = positional[1];

    const char* env_ignore = std::getenv(dj::ignore_env_var);
    options.ignore_fields = dj::merge_ignore_fields(cli_ignore, env_ignore ? env_ignore : "");

    setup_logging(log_level);
    for (const auto& field : options.ignore_fields) {
        spdlog::debug("ignoring {}", dj::to_accessor(dj::parse_accessor(field), true));
    }

    auto summary = dj::run(options, std::cout, std::cerr);
    return summary.exit_status();
}
