#include "commands.hpp"
#include <narrative/core/log.hpp>
#include <iostream>
#include <string>
#include <cstring>

using namespace narrative::cli;

void print_version() {
    std::cout << "Narrative CLI v0.1.0\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return static_cast<int>(Result::InvalidArgs);
    }

    std::string command = argv[1];

    // Handle version flag
    if (command == "--version" || command == "-v") {
        print_version();
        return 0;
    }

    // Handle help
    if (command == "help" || command == "--help" || command == "-h") {
        cmd_help();
        return 0;
    }

    // Engine logging stays quiet unless asked for
    narrative::core::set_log_level(narrative::core::LogLevel::Warn);
    for (int i = 2; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0) {
            narrative::core::set_log_level(narrative::core::LogLevel::Debug);
        }
    }

    if (command == "validate") {
        if (argc < 3) {
            std::cerr << "Error: 'narrative-cli validate' requires a dialogue file\n";
            std::cerr << "Usage: narrative-cli validate <graph.json>\n";
            return static_cast<int>(Result::InvalidArgs);
        }

        return static_cast<int>(cmd_validate(argv[2]));
    }

    if (command == "play") {
        if (argc < 3) {
            std::cerr << "Error: 'narrative-cli play' requires a dialogue file\n";
            std::cerr << "Usage: narrative-cli play <graph.json> [--choices a,b,c] [--save-dir <dir>]\n";
            return static_cast<int>(Result::InvalidArgs);
        }

        PlayOptions options;
        options.graph_path = argv[2];

        // Parse optional arguments
        for (int i = 3; i < argc; ++i) {
            if (std::strcmp(argv[i], "--choices") == 0 && i + 1 < argc) {
                options.choices = split_list(argv[++i]);
            } else if (std::strcmp(argv[i], "--save-dir") == 0 && i + 1 < argc) {
                options.save_dir = argv[++i];
            } else if (std::strcmp(argv[i], "--settings") == 0 && i + 1 < argc) {
                options.settings_path = argv[++i];
            } else if (std::strcmp(argv[i], "--reward") == 0 && i + 1 < argc) {
                options.reward_id = argv[++i];
            } else if (std::strcmp(argv[i], "--save-id") == 0 && i + 1 < argc) {
                options.save_id = argv[++i];
            } else if (std::strcmp(argv[i], "--verbose") != 0) {
                std::cerr << "Error: Unknown option '" << argv[i] << "'\n";
                return static_cast<int>(Result::InvalidArgs);
            }
        }

        return static_cast<int>(cmd_play(options));
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'narrative-cli help' for usage information.\n";
    return static_cast<int>(Result::InvalidArgs);
}
