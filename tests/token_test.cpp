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
 * @file token_test.cpp
 * @brief Unit tests for the raw token layout and its accessors.
 */

#include "sigil/token/token.hpp"
#include "framework.hpp"

#include <chrono>
#include <cstdint>
#include <set>
#include <sstream>
#include <unordered_set>
#include <vector>

using sigil::token::InvalidTokenError;
using sigil::token::Token;

namespace {

struct FieldCase {
    Token::Bytes raw;
    int64_t timestamp;
    Token::MachineId machine;
    uint16_t pid;
    int32_t counter;
};

const std::vector<FieldCase>& field_cases()
{
    static const std::vector<FieldCase> cases = {
        {{0x4d, 0x88, 0xe1, 0x5b, 0x60, 0xf4, 0x86, 0xe4, 0x28, 0x41, 0x2d, 0xc9},
         1300816219,
         {0x60, 0xf4, 0x86},
         0xe428,
         4271561},
        {{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
         0,
         {0x00, 0x00, 0x00},
         0x0000,
         0},
        {{0x00, 0x00, 0x00, 0x00, 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0x00, 0x00, 0x01},
         0,
         {0xaa, 0xbb, 0xcc},
         0xddee,
         1},
    };
    return cases;
}

} // namespace

/**
 * @brief Each field is read from its fixed big-endian byte range.
 */
void test_token_field_extraction()
{
    for (const auto& c : field_cases()) {
        Token token(c.raw);
        auto expected_time = std::chrono::system_clock::time_point(std::chrono::seconds(c.timestamp));
        ASSERT_TRUE(token.time() == expected_time);
        ASSERT_EQ(token.timestamp(), static_cast<uint32_t>(c.timestamp));
        ASSERT_TRUE(token.machine() == c.machine);
        ASSERT_EQ(token.pid(), c.pid);
        ASSERT_EQ(token.counter(), c.counter);
    }
}

/**
 * @brief `machine()` is a value read of bytes 4..6; editing it leaves the token alone.
 */
void test_token_machine_value()
{
    const Token token(Token::Bytes{0x4d, 0x88, 0xe1, 0x5b, 0x60, 0xf4, 0x86, 0xe4, 0x28, 0x41, 0x2d,
                                   0xc9});
    Token::MachineId machine = token.machine();
    ASSERT_EQ(machine[0], token.bytes()[4]);
    ASSERT_EQ(machine[1], token.bytes()[5]);
    ASSERT_EQ(machine[2], token.bytes()[6]);

    machine.fill(0);
    ASSERT_EQ(token.bytes()[4], 0x60);
    ASSERT_EQ(token.machine()[2], 0x86);
}

/**
 * @brief The counter is a 24-bit field and never reads as negative.
 */
void test_token_counter_max()
{
    Token token(Token::Bytes{0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff, 0xff});
    ASSERT_EQ(token.counter(), 0xFFFFFF);
    ASSERT_EQ(token.timestamp(), 0u);
}

/**
 * @brief Only the all-zero value is the zero sentinel.
 */
void test_token_is_zero()
{
    ASSERT_TRUE(Token().is_zero());
    ASSERT_TRUE(Token::nil().is_zero());
    ASSERT_TRUE(Token(Token::Bytes{}).is_zero());

    for (size_t i = 0; i < sigil::token::RAW_LEN; ++i) {
        Token::Bytes raw{};
        raw[i] = 0x01;
        ASSERT_FALSE(Token(raw).is_zero());
    }
}

/**
 * @brief Ordering is unsigned lexicographic over the raw bytes.
 */
void test_token_compare()
{
    Token low(Token::Bytes{0x00, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff});
    Token high(Token::Bytes{0x80, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x00});
    Token high_copy(high.bytes());

    ASSERT_EQ(low.compare(high), -1);
    ASSERT_EQ(high.compare(low), 1);
    ASSERT_EQ(high.compare(high_copy), 0);
    ASSERT_TRUE(low < high);
    ASSERT_FALSE(high < low);
    ASSERT_TRUE(high == high_copy);
    ASSERT_TRUE(low != high);

    // 0xff must sort above 0x01 (no signed-char surprises).
    Token a(Token::Bytes{0x01, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0});
    Token b(Token::Bytes{0xff, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0});
    ASSERT_EQ(a.compare(b), -1);
}

/**
 * @brief The printable form parses back to the same token; garbage is rejected.
 */
void test_token_string_round_trip()
{
    Token token(field_cases()[0].raw);
    std::string text = token.to_string();
    ASSERT_EQ(text.size(), sigil::token::ENCODED_LEN);
    ASSERT_TRUE(Token::from_string(text) == token);

    std::ostringstream os;
    os << token;
    ASSERT_TRUE(Token::from_string(os.str()) == token);

    ASSERT_THROWS(Token::from_string("too-short"), InvalidTokenError);
    ASSERT_THROWS(Token::from_string(std::string(32, '!')), InvalidTokenError);
}

/**
 * @brief Tokens can key both ordered and unordered containers.
 */
void test_token_containers()
{
    std::set<Token> ordered;
    std::unordered_set<Token> hashed;
    for (const auto& c : field_cases()) {
        ordered.insert(Token(c.raw));
        hashed.insert(Token(c.raw));
        hashed.insert(Token(c.raw));
    }
    ASSERT_EQ(ordered.size(), field_cases().size());
    ASSERT_EQ(hashed.size(), field_cases().size());
    ASSERT_TRUE(ordered.begin()->is_zero());
}
