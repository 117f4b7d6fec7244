/**
 * @file main.cpp
 * @brief bsonuuid tool entry point
 *
 * Thin executable over the UUID library:
 * - generate: print fresh v4 UUIDs
 * - validate: check a string against the accepted hex forms
 * - inspect:  parse a UUID and show its text and binary forms
 */

#include <bsonuuid/cli/config.hpp>
#include <bsonuuid/core/uuid.hpp>
#include <bsonuuid/utils/logger.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>

using namespace bsonuuid;
using namespace bsonuuid::cli;

namespace {

std::string formatBytes(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) oss << ' ';
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

int runGenerate(const Config& config, const core::UuidContext& context) {
    LOG_DEBUG("CLI", "Generating {} UUID(s)", config.count);
    for (uint32_t i = 0; i < config.count; ++i) {
        core::UUID uuid(context);
        std::cout << uuid.toHexString(config.include_dashes) << "\n";
    }
    return 0;
}

int runValidate(const Config& config) {
    bool valid = core::UUID::isValid(config.argument);
    LOG_DEBUG("CLI", "Validated '{}': {}", config.argument, valid ? "valid" : "invalid");
    std::cout << (valid ? "valid" : "invalid") << "\n";
    return valid ? 0 : 1;
}

int runInspect(const Config& config, const core::UuidContext& context) {
    auto parsed = core::UUID::create(core::input::HexText{config.argument}, context);
    if (parsed.is_err()) {
        LOG_ERROR("CLI", "Cannot parse '{}': {}", config.argument, parsed.error().what());
        return 1;
    }

    const core::UUID& uuid = parsed.value();
    core::Binary binary = uuid.toBinary();

    std::cout << "canonical: " << uuid.toHexString(true) << "\n"
              << "compact:   " << uuid.toHexString(false) << "\n"
              << "inspect:   " << uuid.inspect() << "\n"
              << "subtype:   0x" << std::hex << std::setw(2) << std::setfill('0')
              << static_cast<int>(binary.subType()) << std::dec
              << " (" << core::binarySubtypeToString(binary.subType()) << ")\n"
              << "bytes:     " << formatBytes(binary.buffer()) << "\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return config.error ? 2 : 0;
    }

    utils::Logger::instance().setLevel(utils::parseLogLevel(config.log_level));

    core::UuidContext context;
    context.cacheHexString = config.cache_hex_string;

    try {
        switch (config.command) {
            case Command::GENERATE: return runGenerate(config, context);
            case Command::VALIDATE: return runValidate(config);
            case Command::INSPECT:  return runInspect(config, context);
        }
    } catch (const std::exception& e) {
        LOG_FATAL("CLI", "Unhandled error: {}", e.what());
        return 1;
    }

    return 0;
}
