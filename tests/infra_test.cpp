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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure (Text, Logger).
 */

#include "sigil/infra/logger.hpp"
#include "sigil/infra/text.hpp"
#include "framework.hpp"

#include <stdexcept>
#include <string>

using sigil::infra::Logger;
using sigil::infra::LogLevel;
using sigil::infra::Text;

/**
 * @brief Machine-id file contents lose their trailing newline; inner text is kept.
 */
void test_text_trim()
{
    ASSERT_EQ(Text::trim("f81d4fae7dec11d0a76500a0c91e6bf6\n"),
              std::string("f81d4fae7dec11d0a76500a0c91e6bf6"));
    ASSERT_EQ(Text::trim("   db host 01\t"), std::string("db host 01"));
    ASSERT_EQ(Text::trim("x"), std::string("x"));
}

/**
 * @brief Blank input collapses to the empty string.
 */
void test_text_trim_blank()
{
    ASSERT_EQ(Text::trim(""), std::string(""));
    ASSERT_EQ(Text::trim("  \t\n  \r "), std::string(""));
}

/**
 * @brief Bytes render as two lowercase hex digits each.
 */
void test_text_to_hex()
{
    const uint8_t id[] = {0x60, 0xf4, 0x86, 0x00, 0x0a};
    ASSERT_EQ(Text::to_hex(id, 3), std::string("60f486"));
    ASSERT_EQ(Text::to_hex(id, 5), std::string("60f486000a"));
    ASSERT_EQ(Text::to_hex(id, 0), std::string(""));
}

/**
 * @brief Level names parse case-insensitively; unknown names are rejected.
 */
void test_logger_parse_level()
{
    ASSERT_TRUE(Logger::parse_level("trace") == LogLevel::TRACE);
    ASSERT_TRUE(Logger::parse_level("DEBUG") == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parse_level("Info") == LogLevel::INFO);
    ASSERT_TRUE(Logger::parse_level("warning") == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("error") == LogLevel::ERROR);
    ASSERT_TRUE(Logger::parse_level("fatal") == LogLevel::FATAL);
    ASSERT_THROWS(Logger::parse_level("verbose"), std::invalid_argument);
}

/**
 * @brief The threshold round-trips and filtered messages are accepted silently.
 */
void test_logger_threshold()
{
    LogLevel saved = Logger::level();

    Logger::set_level(LogLevel::ERROR);
    ASSERT_TRUE(Logger::level() == LogLevel::ERROR);
    Logger::log(LogLevel::DEBUG, "suppressed");

    Logger::set_level(saved);
    ASSERT_TRUE(Logger::level() == saved);
}
