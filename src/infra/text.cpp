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
 * @file text.cpp
 * @brief Implementation of the text helpers.
 */

#include "sigil/infra/text.hpp"

#include <cctype>

namespace sigil::infra {

std::string Text::trim(const std::string& s)
{
    // std::isspace is undefined for negative char values; go through unsigned char.
    auto blank = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

    size_t first = 0;
    while (first < s.size() && blank(s[first])) {
        ++first;
    }
    if (first == s.size()) {
        return "";
    }

    size_t last = s.size();
    while (last > first && blank(s[last - 1])) {
        --last;
    }
    return s.substr(first, last - first);
}

std::string Text::to_hex(const uint8_t* data, size_t size)
{
    static const char digits[] = "0123456789abcdef";

    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

} // namespace sigil::infra
