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
 * @brief Application Entry Point.
 *
 * @details
 * Startup sequence:
 * 1. Argument and environment parsing.
 * 2. Log threshold configuration.
 * 3. Identity bootstrap (only for commands that mint tokens).
 * 4. Command dispatch.
 */

#include "sigil/cli/command.hpp"
#include "sigil/identity/identity.hpp"
#include "sigil/infra/logger.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using sigil::infra::Logger;
using sigil::infra::LogLevel;

int main(int argc, char* argv[])
{
    sigil::cli::Options options;
    try {
        options = sigil::cli::parse_options(argc, argv, std::getenv("SIGIL_LOG_LEVEL"));
    } catch (const sigil::cli::ConfigError& e) {
        Logger::log(LogLevel::ERROR, "Config: " + std::string(e.what()));
        sigil::cli::Command::print_help(argv[0], std::cerr);
        return 2;
    }

    Logger::set_level(Logger::parse_level(options.log_level));

    try {
        switch (options.mode) {
        case sigil::cli::Mode::HELP:
            sigil::cli::Command::print_help(argv[0], std::cout);
            return 0;
        case sigil::cli::Mode::INSPECT:
            return sigil::cli::Command::inspect(options, std::cout);
        case sigil::cli::Mode::NEW:
            // Identity failures surface here, before any token is written.
            return sigil::cli::Command::mint(options, sigil::token::Generator::global(), std::cout);
        }
    } catch (const sigil::identity::InitializationError& e) {
        Logger::log(LogLevel::FATAL, std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
