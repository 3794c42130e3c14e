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
 * @file token.cpp
 * @brief Field accessors and comparison for `Token`.
 */

#include "sigil/token/token.hpp"

#include "sigil/token/codec.hpp"

#include <algorithm>
#include <ostream>

namespace sigil::token {

Token Token::from_string(std::string_view text)
{
    Token token;
    if (!Codec::decode(text, token)) {
        throw InvalidTokenError();
    }
    return token;
}

uint32_t Token::timestamp() const
{
    return (static_cast<uint32_t>(raw_[0]) << 24) | (static_cast<uint32_t>(raw_[1]) << 16) |
           (static_cast<uint32_t>(raw_[2]) << 8) | static_cast<uint32_t>(raw_[3]);
}

std::chrono::system_clock::time_point Token::time() const
{
    return std::chrono::system_clock::time_point(std::chrono::seconds(timestamp()));
}

Token::MachineId Token::machine() const
{
    return {raw_[4], raw_[5], raw_[6]};
}

uint16_t Token::pid() const
{
    return static_cast<uint16_t>((raw_[7] << 8) | raw_[8]);
}

int32_t Token::counter() const
{
    return static_cast<int32_t>((static_cast<uint32_t>(raw_[9]) << 16) |
                                (static_cast<uint32_t>(raw_[10]) << 8) |
                                static_cast<uint32_t>(raw_[11]));
}

bool Token::is_zero() const
{
    return std::all_of(raw_.begin(), raw_.end(), [](uint8_t b) { return b == 0; });
}

int Token::compare(const Token& other) const
{
    // std::array<uint8_t> compares element-wise as unsigned values.
    if (raw_ < other.raw_)
        return -1;
    if (other.raw_ < raw_)
        return 1;
    return 0;
}

std::string Token::to_string() const
{
    return Codec::encode(*this);
}

std::ostream& operator<<(std::ostream& os, const Token& token)
{
    return os << token.to_string();
}

} // namespace sigil::token
