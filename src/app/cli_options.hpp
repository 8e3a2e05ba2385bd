#pragma once

#include "waypoint/core/result.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace waypoint::app {

enum class Command {
    New,
    Show,
    Commit,
    Clear,
    Help
};

struct CliOptions {
    Command command = Command::Help;
    std::string session_id;
    std::filesystem::path diff_file;
    std::optional<std::filesystem::path> config_path;
    bool verbose = false;
};

// waypoint [--config <path>] [--verbose] <new | show <id> | commit <id> <diff.json> | clear <id>>
core::Result<CliOptions, core::Error> parse_cli(const std::vector<std::string>& args);

std::string usage();

}  // namespace waypoint::app
