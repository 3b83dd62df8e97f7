/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief UuidKit shell entry point.
 *
 * @details
 * Startup sequence:
 * 1. Argument Parsing.
 * 2. Session Initialization (open database, install UUID functions).
 * 3. Read-Execute-Print loop over stdin, one statement per line.
 */

#include "uuidkit/infra/logger.hpp"
#include "uuidkit/infra/string.hpp"
#include "uuidkit/shell/handler.hpp"
#include "uuidkit/shell/session.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [DB_PATH] [--log-level LEVEL]\n"
              << "Reads SQL statements from stdin, one per line, and prints one JSON\n"
              << "response per statement. Lines starting with '--' are skipped.\n"
              << "Options:\n"
              << "  DB_PATH            SQLite database file (Default: :memory:)\n"
              << "  --log-level LEVEL  trace|debug|info|warn|error|fatal (Default: warn)\n"
              << "  --help             Show this help message\n";
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    using uuidkit::infra::Logger;
    using uuidkit::infra::LogLevel;

    // 1. Configuration Defaults
    // Diagnostics below WARN would share stdout with the JSON responses.
    std::string db_path = ":memory:";
    Logger::set_level(LogLevel::WARN);

    // 2. Parse Command Line Arguments
    bool have_path = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_help(argv[0]);
            return 0;
        }
        if (arg == "--log-level") {
            auto level = (i + 1 < argc) ? Logger::parse_level(argv[++i]) : std::nullopt;
            if (!level) {
                print_help(argv[0]);
                return 1;
            }
            Logger::set_level(*level);
            continue;
        }
        if (have_path || uuidkit::infra::String::starts_with(arg, "--")) {
            print_help(argv[0]);
            return 1;
        }
        db_path = arg;
        have_path = true;
    }

    try {
        // 3. Session Bootstrap
        uuidkit::shell::Session session(db_path);

        // 4. Read-Execute-Print Loop
        std::string line;
        while (std::getline(std::cin, line)) {
            std::string sql = uuidkit::infra::String::trim(line);
            if (sql.empty() || uuidkit::infra::String::starts_with(sql, "--")) {
                continue;
            }
            std::cout << uuidkit::shell::Handler::execute(session, sql) << std::endl;
        }
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
