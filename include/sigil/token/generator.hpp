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
 * @file generator.hpp
 * @brief Mints new tokens from the process identity and a shared counter.
 *
 * @details
 * Each call stamps the given time, copies the machine and process ids, and
 * takes the next value of a single atomic counter. Counter values observed by
 * all callers are distinct and gap-free modulo 2^24; the counter silently
 * wraps. No clock synchronization or cross-host coordination is attempted.
 */

#pragma once

#include "sigil/identity/identity.hpp"
#include "sigil/token/token.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace sigil::token {

/**
 * @class Generator
 * @brief Thread-safe token factory.
 */
class Generator {
  public:
    /**
     * @brief Builds a generator around a fixed identity.
     *
     * @param id Machine and process ids copied into every token.
     * @param counter_seed Initial counter value. The first token carries
     * `counter_seed + 1` (mod 2^24).
     */
    Generator(const identity::Identity& id, uint32_t counter_seed);

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /// A token stamped with the current wall-clock time.
    Token next();

    /// A token stamped with `at`, truncated to whole Unix seconds.
    Token next(std::chrono::system_clock::time_point at);

    /**
     * @brief The process-wide generator.
     *
     * Built on first use from `SystemIdentitySource`; later calls return the
     * same instance.
     *
     * @throws identity::InitializationError if no identity can be established.
     *
     * @code
     * std::string session = sigil::token::Generator::global().next().to_string();
     * @endcode
     */
    static Generator& global();

  private:
    const identity::Identity identity_;

    /// Only the low 24 bits of each incremented value are stored.
    std::atomic<uint32_t> counter_;
};

} // namespace sigil::token
