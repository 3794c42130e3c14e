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
 * @file identity.hpp
 * @brief Per-process identity: machine id, process id and counter seed.
 *
 * @details
 * The host-facing queries live behind `IdentitySource` so that the generator
 * can be driven by a scripted source in tests. `IdentityResolver` composes the
 * queries into the values a `Generator` needs:
 *
 * - **Machine id**: platform identifier, else host name, else random bytes.
 *   A string answer is hashed with SHA-256 and the first three digest bytes
 *   are kept.
 * - **Process id**: the OS pid, XOR-ed with the CRC-32 of the container marker
 *   (`/proc/self/cpuset`) when that marker is more than a single byte, so that
 *   containers sharing a pid namespace on one host do not collide.
 * - **Counter seed**: three random bytes.
 *
 * Random-source failure on a path that needs it is unrecoverable and raised
 * as `InitializationError`.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace sigil::identity {

/**
 * @class InitializationError
 * @brief No trustworthy identity could be established for this process.
 */
class InitializationError : public std::runtime_error {
  public:
    explicit InitializationError(const std::string& message) : std::runtime_error(message) {}
};

/// The 3-byte machine id stamped into tokens.
using MachineId = std::array<uint8_t, 3>;

/// Identity state shared by every token minted in this process.
struct Identity {
    MachineId machine_id{};
    uint32_t process_id = 0;
};

/**
 * @class IdentitySource
 * @brief Host queries consulted once at startup.
 */
class IdentitySource {
  public:
    virtual ~IdentitySource() = default;

    /// Stable hardware/OS identifier, or nothing if the platform has none.
    virtual std::optional<std::string> platform_machine_id() = 0;

    /// Network host name, or nothing on failure.
    virtual std::optional<std::string> host_name() = 0;

    /// Fills `dst` with cryptographically secure bytes. Returns false on failure.
    virtual bool random_bytes(uint8_t* dst, size_t size) = 0;

    /// The OS process id.
    virtual uint32_t process_id() = 0;

    /// Raw contents of the container marker file, or nothing if unreadable.
    virtual std::optional<std::string> container_marker() = 0;
};

/**
 * @class SystemIdentitySource
 * @brief `IdentitySource` backed by the running host.
 *
 * Platform identifier: `/etc/machine-id` or `/var/lib/dbus/machine-id` on
 * Linux, `kern.hostuuid` on FreeBSD, `hw.uuid` on OpenBSD. Random bytes come
 * from OpenSSL's `RAND_bytes`.
 */
class SystemIdentitySource : public IdentitySource {
  public:
    std::optional<std::string> platform_machine_id() override;
    std::optional<std::string> host_name() override;
    bool random_bytes(uint8_t* dst, size_t size) override;
    uint32_t process_id() override;
    std::optional<std::string> container_marker() override;
};

/**
 * @class IdentityResolver
 * @brief Turns raw host answers into identity values.
 */
class IdentityResolver {
  public:
    /**
     * @brief Derives the 3-byte machine id.
     * @throws InitializationError if every fallback, random bytes included, fails.
     */
    static MachineId machine_id(IdentitySource& source);

    /// Derives the (possibly container-adjusted) process id. Never fails.
    static uint32_t process_id(IdentitySource& source);

    /**
     * @brief Draws the initial counter value, in [0, 2^24).
     * @throws InitializationError if the random source fails.
     */
    static uint32_t counter_seed(IdentitySource& source);

    /// Machine id and process id together.
    static Identity resolve(IdentitySource& source);
};

} // namespace sigil::identity
