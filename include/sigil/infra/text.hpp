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
 * @file text.hpp
 * @brief Small text helpers used when reading host identity and printing tokens.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sigil::infra {

/**
 * @class Text
 * @brief A static container for stateless text helpers.
 */
class Text {
  public:
    /**
     * @brief Strips leading and trailing whitespace.
     *
     * Machine-id files end with a newline and host names may carry stray
     * padding; both are trimmed before hashing so the identity is stable.
     *
     * @return The trimmed copy. Empty if `s` is blank.
     *
     * @code
     * sigil::infra::Text::trim("  f81d4fae7dec11d0a76500a0c91e6bf6\n"); // "f81d4fae..."
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Renders a byte range as lowercase hexadecimal, two digits per byte.
     *
     * @code
     * const uint8_t id[] = {0x60, 0xf4, 0x86};
     * sigil::infra::Text::to_hex(id, 3); // "60f486"
     * @endcode
     */
    static std::string to_hex(const uint8_t* data, size_t size);
};

} // namespace sigil::infra
