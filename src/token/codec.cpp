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
 * @file codec.cpp
 * @brief Placement-shuffled base-32 packing of tokens.
 *
 * @details
 * Encoding:
 * 1. **Split**: the 12 bytes become 20 five-bit groups, MSB first.
 * 2. **Shuffle**: a permutation of the candidate offsets is drawn.
 * 3. **Emit**: pointers, mobile groups and anchors are written.
 *
 * Decoding runs in two passes: every pointer is resolved and checked first,
 * then the 20 groups are gathered and joined back into bytes.
 */

#include "sigil/token/codec.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

namespace sigil::token {

namespace {

constexpr size_t GROUP_COUNT = 20;
constexpr size_t GROUP_BITS = 5;
constexpr size_t RAW_BITS = RAW_LEN * 8;
constexpr uint8_t GROUP_MASK = 0x1F;
constexpr uint8_t INVALID_SYMBOL = 0xFF;

using Groups = std::array<uint8_t, GROUP_COUNT>;

constexpr Placement CANDIDATE_OFFSETS = {0, 3, 5, 7, 9, 11, 17, 19, 21, 23, 27, 31};

// Mobile groups in logical order: timestamp (4), machine (3), pid (2), counter (3).
constexpr std::array<uint8_t, MOBILE_GROUPS> MOBILE_GROUP_INDEX = {0,  1,  2,  3,  6,  7,
                                                                   8,  11, 12, 14, 16, 18};
constexpr std::array<uint8_t, MOBILE_GROUPS> POINTER_OFFSETS = {2,  13, 22, 30, 6,  15,
                                                                26, 10, 18, 1,  14, 25};

constexpr std::array<uint8_t, ANCHOR_GROUPS> ANCHOR_GROUP_INDEX = {4, 5, 9, 10, 13, 15, 17, 19};
constexpr std::array<uint8_t, ANCHOR_GROUPS> ANCHOR_OFFSETS = {4, 8, 12, 16, 20, 24, 28, 29};

// The last anchor holds the zero-padded tail group; it is the one re-encoded on decode.
constexpr size_t TAIL_OFFSET = 29;

const std::array<uint8_t, 256>& symbol_values()
{
    static const std::array<uint8_t, 256> table = [] {
        std::array<uint8_t, 256> t{};
        t.fill(INVALID_SYMBOL);
        for (size_t i = 0; i < Codec::ALPHABET.size(); ++i) {
            t[static_cast<unsigned char>(Codec::ALPHABET[i])] = static_cast<uint8_t>(i);
        }
        return t;
    }();
    return table;
}

uint8_t value_of(char c)
{
    return symbol_values()[static_cast<unsigned char>(c)];
}

bool stream_bit(const Token::Bytes& raw, size_t bit)
{
    if (bit >= RAW_BITS) {
        return false;
    }
    return (raw[bit / 8] >> (7 - bit % 8)) & 0x01;
}

Groups split(const Token::Bytes& raw)
{
    Groups groups{};
    for (size_t g = 0; g < GROUP_COUNT; ++g) {
        uint8_t value = 0;
        for (size_t b = 0; b < GROUP_BITS; ++b) {
            value = static_cast<uint8_t>((value << 1) | stream_bit(raw, g * GROUP_BITS + b));
        }
        groups[g] = value;
    }
    return groups;
}

Token::Bytes join(const Groups& groups)
{
    Token::Bytes raw{};
    for (size_t bit = 0; bit < RAW_BITS; ++bit) {
        uint8_t group = groups[bit / GROUP_BITS];
        if ((group >> (GROUP_BITS - 1 - bit % GROUP_BITS)) & 0x01) {
            raw[bit / 8] |= static_cast<uint8_t>(0x80 >> (bit % 8));
        }
    }
    return raw;
}

bool is_candidate(uint8_t offset)
{
    return std::find(CANDIDATE_OFFSETS.begin(), CANDIDATE_OFFSETS.end(), offset) !=
           CANDIDATE_OFFSETS.end();
}

// True if `placement` names each candidate offset exactly once.
bool is_candidate_permutation(const Placement& placement)
{
    uint32_t seen = 0;
    for (uint8_t offset : placement) {
        if (offset >= ENCODED_LEN || !is_candidate(offset) || (seen & (1u << offset))) {
            return false;
        }
        seen |= 1u << offset;
    }
    return true;
}

} // namespace

void RandomShuffler::shuffle(Placement& positions)
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());

    std::shuffle(positions.begin(), positions.end(), gen);
}

const Placement& Codec::candidate_positions()
{
    return CANDIDATE_OFFSETS;
}

bool Codec::is_symbol(char c)
{
    return value_of(c) != INVALID_SYMBOL;
}

std::string Codec::encode(const Token& token)
{
    static RandomShuffler shuffler;
    return encode(token, shuffler);
}

std::string Codec::encode(const Token& token, Shuffler& shuffler)
{
    Placement placement = CANDIDATE_OFFSETS;
    shuffler.shuffle(placement);
    if (!is_candidate_permutation(placement)) {
        throw std::invalid_argument("Codec: shuffler did not return a permutation of the candidate offsets");
    }

    const Groups groups = split(token.bytes());
    std::string dst(ENCODED_LEN, ALPHABET[0]);

    for (size_t k = 0; k < MOBILE_GROUPS; ++k) {
        dst[POINTER_OFFSETS[k]] = ALPHABET[placement[k]];
        dst[placement[k]] = ALPHABET[groups[MOBILE_GROUP_INDEX[k]]];
    }
    for (size_t a = 0; a < ANCHOR_GROUPS; ++a) {
        dst[ANCHOR_OFFSETS[a]] = ALPHABET[groups[ANCHOR_GROUP_INDEX[a]]];
    }
    return dst;
}

bool Codec::decode(std::string_view text, Token& out)
{
    out = Token();

    if (text.size() != ENCODED_LEN) {
        return false;
    }
    if (!std::all_of(text.begin(), text.end(), [](char c) { return is_symbol(c); })) {
        return false;
    }

    // Pass 1: resolve pointers. They must name each candidate offset exactly once.
    Placement placement{};
    for (size_t k = 0; k < MOBILE_GROUPS; ++k) {
        placement[k] = value_of(text[POINTER_OFFSETS[k]]);
    }
    if (!is_candidate_permutation(placement)) {
        return false;
    }

    // Pass 2: gather data groups. Every data symbol carries exactly five bits.
    Groups groups{};
    for (size_t k = 0; k < MOBILE_GROUPS; ++k) {
        groups[MOBILE_GROUP_INDEX[k]] = value_of(text[placement[k]]);
    }
    for (size_t a = 0; a < ANCHOR_GROUPS; ++a) {
        groups[ANCHOR_GROUP_INDEX[a]] = value_of(text[ANCHOR_OFFSETS[a]]);
    }
    if (std::any_of(groups.begin(), groups.end(), [](uint8_t g) { return g > GROUP_MASK; })) {
        return false;
    }

    const Token::Bytes raw = join(groups);

    // The tail group holds the last bit of byte 11 followed by four zero bits.
    if (ALPHABET[(raw[RAW_LEN - 1] & 0x01) << 4] != text[TAIL_OFFSET]) {
        return false;
    }

    out = Token(raw);
    return true;
}

} // namespace sigil::token
