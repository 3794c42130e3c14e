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
 * @file codec.hpp
 * @brief Bidirectional conversion between a `Token` and its 32-character text.
 *
 * @details
 * The 96-bit token is cut most-significant-bit first into 20 five-bit groups
 * (the last group holds one real bit and four zero bits). The groups are then
 * spread over the 32 output characters in three roles:
 *
 * - **Anchors** (8 groups): always written at the same offsets
 *   `4 8 12 16 20 24 28 29`.
 * - **Mobile groups** (12 groups, the ones covering the timestamp, machine id,
 *   pid and counter): written at 12 candidate offsets
 *   `0 3 5 7 9 11 17 19 21 23 27 31`, in an order drawn freshly per encode.
 * - **Pointers** (12 characters): one per mobile group at a fixed offset
 *   (timestamp `2 13 22 30`, machine `6 15 26`, pid `10 18`, counter `1 14 25`),
 *   holding the candidate offset that received that group.
 *
 * Reading a field therefore needs one level of indirection, so its characters
 * cannot be found by offset alone. Symbols are drawn from a 64-character
 * alphabet; a symbol's value is its index in `Codec::ALPHABET`.
 */

#pragma once

#include "sigil/token/token.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace sigil::token {

/// Number of mobile groups, and of candidate and pointer offsets.
constexpr size_t MOBILE_GROUPS = 12;

/// Number of groups written at fixed offsets.
constexpr size_t ANCHOR_GROUPS = 8;

/// Candidate offsets in the order mobile groups will occupy them.
using Placement = std::array<uint8_t, MOBILE_GROUPS>;

/**
 * @class Shuffler
 * @brief Source of the per-encode placement permutation.
 *
 * @details
 * Implementations receive the candidate offsets in ascending order and must
 * leave a permutation of them in `positions`. They must be safe to call from
 * several threads at once. Tests inject a fixed implementation to obtain
 * reproducible encodings.
 */
class Shuffler {
  public:
    virtual ~Shuffler() = default;

    virtual void shuffle(Placement& positions) = 0;
};

/**
 * @class RandomShuffler
 * @brief Uniform, non-cryptographic shuffle backed by a per-thread PRNG.
 *
 * Each thread owns a `std::mt19937_64` seeded from `std::random_device`, so
 * concurrent encodes never contend on a lock.
 */
class RandomShuffler : public Shuffler {
  public:
    void shuffle(Placement& positions) override;
};

/**
 * @class Codec
 * @brief Static encoder/decoder for the printable token form.
 */
class Codec {
  public:
    /// The 64 symbols; a symbol's value is its index.
    static constexpr std::string_view ALPHABET =
        "aAbBcCdDeEfFgGhHiIjJkKlLmMnNoOpPqQrRsStTuUvVwWxXyYzZ0123456789-_";

    /// The 12 candidate offsets, ascending.
    static const Placement& candidate_positions();

    /**
     * @brief Encodes with a fresh random placement.
     *
     * Total: any 12 bytes are encodable and the result is always 32 symbols.
     */
    static std::string encode(const Token& token);

    /**
     * @brief Encodes using the placement produced by `shuffler`.
     *
     * Mobile group *k* (in timestamp, machine, pid, counter order) is written
     * at `placement[k]`.
     *
     * @throws std::invalid_argument if the shuffler leaves anything other
     *         than a permutation of the candidate offsets.
     */
    static std::string encode(const Token& token, Shuffler& shuffler);

    /**
     * @brief Decodes a printable token.
     *
     * Rejects input that is not exactly 32 alphabet symbols, whose pointers
     * are not a permutation of the candidate offsets, whose data characters
     * carry more than five bits, or whose final anchor does not re-encode to
     * itself.
     *
     * @param text The 32-character form.
     * @param out Receives the token; reset to zero on failure.
     * @return true on success.
     *
     * @code
     * sigil::token::Token token;
     * if (!sigil::token::Codec::decode(cookie, token)) {
     *     return reject();
     * }
     * @endcode
     */
    static bool decode(std::string_view text, Token& out);

    /// True if `c` belongs to `ALPHABET`.
    static bool is_symbol(char c);
};

} // namespace sigil::token
