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
 * @file command.hpp
 * @brief Command-line front end: option parsing and command dispatch.
 *
 * @details
 * Usage:
 * - `sigil new [-n COUNT] [--at UNIX_SECONDS] [--json]` mints tokens.
 * - `sigil inspect TOKEN...` decodes tokens and prints their fields as JSON.
 * - `sigil --help`
 *
 * `--log-level LEVEL` is accepted anywhere; otherwise the `SIGIL_LOG_LEVEL`
 * environment variable applies, defaulting to `info`.
 */

#pragma once

#include "sigil/token/generator.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace sigil::cli {

/**
 * @class ConfigError
 * @brief The command line could not be understood.
 */
class ConfigError : public std::runtime_error {
  public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

enum class Mode { HELP, NEW, INSPECT };

/// Parsed command line.
struct Options {
    Mode mode = Mode::HELP;
    size_t count = 1;
    std::optional<uint32_t> at; ///< Fixed Unix timestamp for `new`.
    bool json = false;
    std::vector<std::string> tokens; ///< Operands of `inspect`.
    std::string log_level = "info";
};

/**
 * @brief Parses `argv` (including the program name at index 0).
 *
 * @param env_log_level Value of `SIGIL_LOG_LEVEL`, or null if unset.
 * @throws ConfigError on unknown commands, flags or malformed values.
 */
Options parse_options(int argc, const char* const argv[], const char* env_log_level = nullptr);

/**
 * @class Command
 * @brief The `new` and `inspect` commands.
 *
 * `inspect` never touches the process identity, so it works even where the
 * generator could not be initialized.
 */
class Command {
  public:
    /**
     * @brief Mints `options.count` tokens, one per line.
     *
     * With `options.json` each line is the `describe()` object instead of the
     * bare token text.
     *
     * @return Process exit code (always 0).
     */
    static int mint(const Options& options, token::Generator& generator, std::ostream& out);

    /**
     * @brief Decodes every operand and prints one JSON object per line.
     *
     * @return 0 if all tokens decoded, 1 otherwise.
     */
    static int inspect(const Options& options, std::ostream& out);

    /// Writes usage text.
    static void print_help(const std::string& binary_name, std::ostream& out);

    /**
     * @brief Describes one token text as a compact JSON object.
     *
     * Valid: `{"token","valid":true,"time","utc","machine","pid","counter"}`.
     * Invalid: `{"token","valid":false,"error"}`.
     */
    static std::string describe(const std::string& text);
};

} // namespace sigil::cli
