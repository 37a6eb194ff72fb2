#ifndef FACEFLAT_CLI_COMMON_HPP
#define FACEFLAT_CLI_COMMON_HPP

#include <serialization/config_json.hpp>
#include <common/logging.hpp>
#include <string>
#include <optional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace faceflat::cli {

// Common context for all CLI commands
struct CommandContext {
    std::string input_path;
    std::string output_path;
    std::optional<std::string> config_path;
    std::optional<std::string> stats_path;
    std::optional<size_t> face_id;
    std::string format = "dxf";
    bool verbose = false;
    bool help = false;
};

inline size_t parse_face_id(const std::string& text) {
    size_t consumed = 0;
    long long value = -1;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != text.size() || value < 0) {
        throw std::runtime_error("--face expects a non-negative integer, got: " + text);
    }
    return static_cast<size_t>(value);
}

// Parse common arguments from command line
// Returns the context and the index of the first unprocessed argument
inline std::pair<CommandContext, int> parse_common_args(int argc, char** argv, int start_idx) {
    CommandContext ctx;
    int i = start_idx;

    auto require_value = [&](const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(flag + " requires an argument");
        }
        std::string value = argv[i + 1];
        i += 2;
        return value;
    };

    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-v" || arg == "--verbose") {
            ctx.verbose = true;
            ++i;
        } else if (arg == "-o" || arg == "--output") {
            ctx.output_path = require_value("-o/--output");
        } else if (arg == "-c" || arg == "--config") {
            ctx.config_path = require_value("-c/--config");
        } else if (arg == "-f" || arg == "--face") {
            ctx.face_id = parse_face_id(require_value("-f/--face"));
        } else if (arg == "-s" || arg == "--stats") {
            ctx.stats_path = require_value("-s/--stats");
        } else if (arg == "--format") {
            ctx.format = require_value("--format");
        } else if (arg == "-h" || arg == "--help") {
            ctx.help = true;
            ++i;
        } else if (arg[0] != '-') {
            // Positional argument (face-set file)
            if (ctx.input_path.empty()) {
                ctx.input_path = arg;
                ++i;
            } else {
                throw std::runtime_error("Unexpected positional argument: " + arg);
            }
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (ctx.verbose) {
        logging::get_logger()->set_level(spdlog::level::debug);
    }

    return {ctx, i};
}

// Config file named by -c, or the defaults
inline AppConfig load_config(const CommandContext& ctx) {
    if (!ctx.config_path) {
        return AppConfig{};
    }
    logging::get_logger()->debug("Loading config from {}", *ctx.config_path);
    return load_app_config(*ctx.config_path);
}

// Command function declarations
int command_faces(int argc, char** argv);
int command_export(int argc, char** argv);
int command_preview(int argc, char** argv);

}  // namespace faceflat::cli

#endif // FACEFLAT_CLI_COMMON_HPP
