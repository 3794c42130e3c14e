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
 * @file token.hpp
 * @brief The 12-byte structured identifier and its field accessors.
 *
 * @details
 * A `Token` is four big-endian fields laid end to end:
 *
 * | Bytes | Field      | Meaning                                  |
 * |-------|------------|------------------------------------------|
 * | 0-3   | Timestamp  | Seconds since the Unix epoch (u32)       |
 * | 4-6   | Machine ID | Opaque per-host identifier               |
 * | 7-8   | Process ID | OS pid, possibly container-adjusted (u16)|
 * | 9-11  | Counter    | Generation sequence, wraps at 2^24       |
 *
 * This raw form is canonical. The printable 32-character form is produced by
 * `sigil::token::Codec` and always decodes back to exactly these bytes.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sigil::token {

/// Size of the binary form.
constexpr size_t RAW_LEN = 12;

/// Size of the printable form.
constexpr size_t ENCODED_LEN = 32;

/// Size of the machine id field.
constexpr size_t MACHINE_ID_LEN = 3;

/**
 * @class InvalidTokenError
 * @brief Raised when text cannot be decoded into a token.
 *
 * Always recoverable: it describes caller input, never process state.
 */
class InvalidTokenError : public std::runtime_error {
  public:
    InvalidTokenError() : std::runtime_error("invalid token") {}
    explicit InvalidTokenError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @class Token
 * @brief A fixed-size, globally unique, non-sortable identifier.
 *
 * @details
 * Accessors are total over any 12-byte value: no validation is performed and
 * the fields only carry meaning for tokens minted by `Generator` or produced
 * by a successful decode. A default-constructed token is the zero sentinel.
 */
class Token {
  public:
    using Bytes = std::array<uint8_t, RAW_LEN>;
    using MachineId = std::array<uint8_t, MACHINE_ID_LEN>;

    /// Constructs the zero ("no token") value.
    Token() = default;

    /// Wraps 12 raw bytes as-is.
    explicit Token(const Bytes& raw) : raw_(raw) {}

    /// The zero sentinel.
    static Token nil() { return Token(); }

    /**
     * @brief Decodes the 32-character printable form.
     *
     * @throws InvalidTokenError if `text` is not a well-formed token.
     *
     * @code
     * auto token = sigil::token::Token::from_string(header_value);
     * @endcode
     */
    static Token from_string(std::string_view text);

    /// Creation time, second precision.
    std::chrono::system_clock::time_point time() const;

    /// Raw timestamp field, seconds since the Unix epoch.
    uint32_t timestamp() const;

    /// Copy of the 3-byte machine id field.
    MachineId machine() const;

    /// Process id field.
    uint16_t pid() const;

    /// 24-bit counter field. Never negative.
    int32_t counter() const;

    /// True iff all 12 bytes are zero.
    bool is_zero() const;

    /**
     * @brief Unsigned lexicographic comparison of the raw bytes.
     * @return -1, 0 or 1.
     */
    int compare(const Token& other) const;

    /// Raw 12-byte view.
    const Bytes& bytes() const { return raw_; }

    /// Printable form, with a freshly shuffled placement.
    std::string to_string() const;

    bool operator==(const Token& other) const { return raw_ == other.raw_; }
    bool operator!=(const Token& other) const { return raw_ != other.raw_; }
    bool operator<(const Token& other) const { return compare(other) < 0; }

  private:
    Bytes raw_{};
};

/// Writes the printable form.
std::ostream& operator<<(std::ostream& os, const Token& token);

} // namespace sigil::token

namespace std {

template <> struct hash<sigil::token::Token> {
    size_t operator()(const sigil::token::Token& token) const noexcept
    {
        // FNV-1a over the raw bytes.
        uint64_t h = 1469598103934665603ULL;
        for (uint8_t b : token.bytes()) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

} // namespace std
