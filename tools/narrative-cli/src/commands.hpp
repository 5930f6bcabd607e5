#pragma once

#include <string>
#include <vector>

namespace narrative::cli {

// Command result codes
enum class Result {
    Success = 0,
    Invalid = 1,
    InvalidArgs = 2,
    FileError = 3,
    RuntimeError = 4
};

struct PlayOptions {
    std::string graph_path;
    std::vector<std::string> choices;   // Option ids, consumed in order
    std::string save_dir;               // Empty keeps rewards in memory
    std::string settings_path;
    std::string reward_id = "journal";
    std::string save_id = "cli";
};

// narrative-cli validate <graph.json>
// Loads and validates a dialogue document
Result cmd_validate(const std::string& graph_path);

// narrative-cli play <graph.json> [--choices a,b,c] [--save-dir <dir>] [--settings <file>]
// Runs a scripted session; options not covered by --choices pick the first available
Result cmd_play(const PlayOptions& options);

// narrative-cli help
// Prints help information
void cmd_help();

// Utility functions
std::vector<std::string> split_list(const std::string& text, char separator = ',');

} // namespace narrative::cli
