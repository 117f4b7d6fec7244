/**
 * @file config.hpp
 * @brief bsonuuid tool configuration and CLI parsing
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace bsonuuid {
namespace cli {

/**
 * @brief Tool commands
 */
enum class Command {
    GENERATE,
    VALIDATE,
    INSPECT
};

/**
 * @brief Tool configuration structure
 */
struct Config {
    Command command = Command::GENERATE;
    std::string argument;                 ///< Value for validate / inspect
    uint32_t count = 1;                   ///< UUIDs printed by generate
    bool include_dashes = true;
    bool cache_hex_string = false;
    std::string log_level = "WARN";
    bool help = false;
    bool error = false;                   ///< help was forced by a parse error
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "bsonuuid - BSON UUID utility\n\n"
              << "Usage: " << program_name << " [OPTIONS] [COMMAND] [ARG]\n\n"
              << "Commands:\n"
              << "  generate              Print new v4 UUIDs (default)\n"
              << "  validate <value>      Report whether <value> is a valid UUID string\n"
              << "  inspect <hex>         Print canonical, compact and binary forms of <hex>\n"
              << "\nOptions:\n"
              << "  --count <n>           Number of UUIDs to generate (default: 1)\n"
              << "  --no-dashes           Print the compact 32-character form\n"
              << "  --cache               Cache hex strings on created UUIDs\n"
              << "  --log-level <level>   Log level: TRACE, DEBUG, INFO, WARN, ERROR, FATAL (default: WARN)\n"
              << "\n  --help, -h            Show this help message\n\n"
              << "Example:\n"
              << "  " << program_name << " --count 5\n"
              << "  " << program_name << " validate 00112233-4455-4677-8899-aabbccddeeff\n"
              << "  " << program_name << " --no-dashes inspect 00112233445546778899aabbccddeeff\n";
}

namespace detail {

inline Config failWith(Config config, const std::string& message) {
    std::cerr << "Error: " << message << "\n";
    config.help = true;
    config.error = true;
    return config;
}

}  // namespace detail

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help and error are set on any problem
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;
    bool have_command = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }

        // Flags
        if (std::strcmp(arg, "--no-dashes") == 0) {
            config.include_dashes = false;
            continue;
        }
        if (std::strcmp(arg, "--cache") == 0) {
            config.cache_hex_string = true;
            continue;
        }

        // Options that require a value
        if (std::strcmp(arg, "--count") == 0 || std::strcmp(arg, "--log-level") == 0) {
            if (i + 1 >= argc) {
                return detail::failWith(config, std::string("Option ") + arg + " requires a value");
            }
            const char* value = argv[++i];

            if (std::strcmp(arg, "--count") == 0) {
                // stoul accepts and wraps negative input
                if (std::strchr(value, '-') != nullptr) {
                    return detail::failWith(config, std::string("Invalid count ") + value);
                }
                try {
                    unsigned long parsed = std::stoul(value);
                    if (parsed > std::numeric_limits<uint32_t>::max()) {
                        return detail::failWith(config, std::string("Invalid count ") + value);
                    }
                    config.count = static_cast<uint32_t>(parsed);
                } catch (const std::logic_error&) {
                    return detail::failWith(config, std::string("Invalid count ") + value);
                }
            } else {
                config.log_level = value;
            }
            continue;
        }

        if (std::strncmp(arg, "--", 2) == 0) {
            return detail::failWith(config, std::string("Unknown option ") + arg);
        }

        // Positional: command, then its argument
        if (!have_command) {
            have_command = true;
            if (std::strcmp(arg, "generate") == 0) {
                config.command = Command::GENERATE;
            } else if (std::strcmp(arg, "validate") == 0) {
                config.command = Command::VALIDATE;
            } else if (std::strcmp(arg, "inspect") == 0) {
                config.command = Command::INSPECT;
            } else {
                return detail::failWith(config, std::string("Unknown command ") + arg);
            }
        } else if (config.command != Command::GENERATE && config.argument.empty()) {
            config.argument = arg;
        } else {
            return detail::failWith(config, std::string("Unexpected argument ") + arg);
        }
    }

    if (config.command != Command::GENERATE && config.argument.empty()) {
        return detail::failWith(config, "Command requires an argument");
    }

    return config;
}

}  // namespace cli
}  // namespace bsonuuid
