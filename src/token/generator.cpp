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
 * @file generator.cpp
 * @brief Implementation of token generation.
 */

#include "sigil/token/generator.hpp"

#include "sigil/infra/logger.hpp"
#include "sigil/infra/text.hpp"

#include <type_traits>

namespace sigil::token {

static_assert(std::is_same_v<identity::MachineId, Token::MachineId>,
              "identity and token machine id layouts differ");

namespace {

Generator& build_global()
{
    identity::SystemIdentitySource source;
    identity::Identity id = identity::IdentityResolver::resolve(source);
    uint32_t seed = identity::IdentityResolver::counter_seed(source);

    static Generator generator(id, seed);

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Generator: ready (machine " +
                           infra::Text::to_hex(id.machine_id.data(), id.machine_id.size()) +
                           ", pid " + std::to_string(id.process_id & 0xFFFF) + ")");
    return generator;
}

} // namespace

Generator::Generator(const identity::Identity& id, uint32_t counter_seed)
    : identity_(id), counter_(counter_seed)
{
}

Token Generator::next()
{
    return next(std::chrono::system_clock::now());
}

Token Generator::next(std::chrono::system_clock::time_point at)
{
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(at.time_since_epoch()).count();
    uint32_t ts = static_cast<uint32_t>(secs);
    uint32_t pid = identity_.process_id;
    uint32_t count = counter_.fetch_add(1, std::memory_order_relaxed) + 1;

    Token::Bytes raw{};
    raw[0] = static_cast<uint8_t>(ts >> 24);
    raw[1] = static_cast<uint8_t>(ts >> 16);
    raw[2] = static_cast<uint8_t>(ts >> 8);
    raw[3] = static_cast<uint8_t>(ts);
    raw[4] = identity_.machine_id[0];
    raw[5] = identity_.machine_id[1];
    raw[6] = identity_.machine_id[2];
    raw[7] = static_cast<uint8_t>(pid >> 8);
    raw[8] = static_cast<uint8_t>(pid);
    raw[9] = static_cast<uint8_t>(count >> 16);
    raw[10] = static_cast<uint8_t>(count >> 8);
    raw[11] = static_cast<uint8_t>(count);
    return Token(raw);
}

Generator& Generator::global()
{
    // Function-local static: initialized once, retried if the first attempt throws.
    static Generator& instance = build_global();
    return instance;
}

} // namespace sigil::token
