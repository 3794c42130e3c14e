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
 * @file command.cpp
 * @brief Option parsing and the `new` / `inspect` commands.
 */

#include "sigil/cli/command.hpp"

#include "sigil/infra/logger.hpp"
#include "sigil/infra/text.hpp"
#include "sigil/token/codec.hpp"

#include <cJSON.h>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace sigil::cli {

namespace {

constexpr size_t MAX_COUNT = 1000000;

uint64_t parse_unsigned(const std::string& flag, const std::string& value, uint64_t max)
{
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigError("Invalid value for " + flag + ": '" + value + "'");
    }
    try {
        unsigned long long parsed = std::stoull(value);
        if (parsed > max) {
            throw ConfigError("Value for " + flag + " out of range: " + value);
        }
        return parsed;
    } catch (const std::out_of_range&) {
        throw ConfigError("Value for " + flag + " out of range: " + value);
    }
}

std::string utc_string(uint32_t seconds)
{
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string print_and_release(cJSON* item)
{
    char* raw = cJSON_PrintUnformatted(item);
    std::string result = raw ? raw : "";
    free(raw);
    cJSON_Delete(item);
    return result;
}

cJSON* describe_item(const std::string& text, bool& valid)
{
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "token", text.c_str());

    token::Token t;
    valid = token::Codec::decode(text, t);
    cJSON_AddBoolToObject(item, "valid", valid);
    if (!valid) {
        cJSON_AddStringToObject(item, "error", "invalid token");
        return item;
    }

    auto machine = t.machine();
    cJSON_AddNumberToObject(item, "time", static_cast<double>(t.timestamp()));
    cJSON_AddStringToObject(item, "utc", utc_string(t.timestamp()).c_str());
    cJSON_AddStringToObject(item, "machine",
                            infra::Text::to_hex(machine.data(), machine.size()).c_str());
    cJSON_AddNumberToObject(item, "pid", t.pid());
    cJSON_AddNumberToObject(item, "counter", t.counter());
    return item;
}

} // namespace

Options parse_options(int argc, const char* const argv[], const char* env_log_level)
{
    Options options;
    if (env_log_level && *env_log_level) {
        options.log_level = env_log_level;
    }

    bool mode_seen = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ConfigError("Missing value for " + flag);
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.mode = Mode::HELP;
            break;
        } else if (arg == "--log-level") {
            options.log_level = value(arg);
        } else if (!mode_seen) {
            if (arg == "new") {
                options.mode = Mode::NEW;
            } else if (arg == "inspect") {
                options.mode = Mode::INSPECT;
            } else {
                throw ConfigError("Unknown command '" + arg + "'");
            }
            mode_seen = true;
        } else if (options.mode == Mode::NEW && (arg == "-n" || arg == "--count")) {
            options.count = static_cast<size_t>(parse_unsigned(arg, value(arg), MAX_COUNT));
            if (options.count == 0) {
                throw ConfigError("Value for " + arg + " must be at least 1");
            }
        } else if (options.mode == Mode::NEW && arg == "--at") {
            options.at = static_cast<uint32_t>(
                parse_unsigned(arg, value(arg), std::numeric_limits<uint32_t>::max()));
        } else if (options.mode == Mode::NEW && arg == "--json") {
            options.json = true;
        } else if (options.mode == Mode::INSPECT && arg.rfind("--", 0) != 0) {
            options.tokens.push_back(arg);
        } else {
            throw ConfigError("Unknown option '" + arg + "'");
        }
    }

    if (options.mode == Mode::INSPECT && options.tokens.empty()) {
        throw ConfigError("inspect requires at least one token");
    }

    try {
        infra::Logger::parse_level(options.log_level);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    return options;
}

void Command::print_help(const std::string& binary_name, std::ostream& out)
{
    out << "Usage: " << binary_name << " <command> [options]\n"
        << "Commands:\n"
        << "  new [-n COUNT] [--at UNIX_SECONDS] [--json]   Mint COUNT tokens (default 1)\n"
        << "  inspect TOKEN...                              Decode tokens and print their fields\n"
        << "Options:\n"
        << "  --log-level LEVEL   trace|debug|info|warn|error|fatal (env: SIGIL_LOG_LEVEL)\n"
        << "  --help              Show this help message\n";
}

std::string Command::describe(const std::string& text)
{
    bool valid = false;
    return print_and_release(describe_item(text, valid));
}

int Command::mint(const Options& options, token::Generator& generator, std::ostream& out)
{
    for (size_t i = 0; i < options.count; ++i) {
        token::Token t = options.at ? generator.next(std::chrono::system_clock::time_point(
                                          std::chrono::seconds(*options.at)))
                                    : generator.next();
        std::string text = t.to_string();
        out << (options.json ? describe(text) : text) << "\n";
    }
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "CLI: minted " + std::to_string(options.count) + " token(s)");
    return 0;
}

int Command::inspect(const Options& options, std::ostream& out)
{
    int status = 0;
    for (const auto& text : options.tokens) {
        bool valid = false;
        out << print_and_release(describe_item(text, valid)) << "\n";
        if (!valid) {
            infra::Logger::log(infra::LogLevel::ERROR, "CLI: rejected token '" + text + "'");
            status = 1;
        }
    }
    return status;
}

} // namespace sigil::cli
