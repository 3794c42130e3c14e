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
 * @file identity.cpp
 * @brief Fallback chain and derivations performed by `IdentityResolver`.
 */

#include "sigil/identity/identity.hpp"

#include "sigil/infra/logger.hpp"
#include "sigil/infra/text.hpp"

#include <openssl/sha.h>
#include <zlib.h>

using sigil::infra::Logger;
using sigil::infra::LogLevel;

namespace sigil::identity {

namespace {

std::optional<std::string> non_blank(std::optional<std::string> value)
{
    if (!value) {
        return std::nullopt;
    }
    std::string trimmed = infra::Text::trim(*value);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

MachineId hash_prefix(const std::string& hid)
{
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(hid.data()), hid.size(), digest);
    return {digest[0], digest[1], digest[2]};
}

} // namespace

MachineId IdentityResolver::machine_id(IdentitySource& source)
{
    MachineId id{};

    if (auto hid = non_blank(source.platform_machine_id())) {
        id = hash_prefix(*hid);
        Logger::log(LogLevel::DEBUG, "Identity: machine id " + infra::Text::to_hex(id.data(), id.size()) +
                                         " derived from platform identifier");
        return id;
    }

    if (auto host = non_blank(source.host_name())) {
        id = hash_prefix(*host);
        Logger::log(LogLevel::DEBUG, "Identity: machine id " + infra::Text::to_hex(id.data(), id.size()) +
                                         " derived from host name '" + *host + "'");
        return id;
    }

    if (!source.random_bytes(id.data(), id.size())) {
        throw InitializationError(
            "Identity: no platform identifier or host name, and the random source failed");
    }
    Logger::log(LogLevel::WARN, "Identity: no platform identifier or host name, using random machine id " +
                                    infra::Text::to_hex(id.data(), id.size()));
    return id;
}

uint32_t IdentityResolver::process_id(IdentitySource& source)
{
    uint32_t pid = source.process_id();

    // A single "/" means the root cpuset, i.e. not containerized.
    auto marker = source.container_marker();
    if (marker && marker->size() > 1) {
        uLong checksum = crc32(0L, Z_NULL, 0);
        checksum = crc32(checksum, reinterpret_cast<const Bytef*>(marker->data()),
                         static_cast<uInt>(marker->size()));
        pid ^= static_cast<uint32_t>(checksum);
        Logger::log(LogLevel::DEBUG, "Identity: pid adjusted with container marker checksum");
    }
    return pid;
}

uint32_t IdentityResolver::counter_seed(IdentitySource& source)
{
    uint8_t b[3];
    if (!source.random_bytes(b, sizeof(b))) {
        throw InitializationError("Identity: cannot seed the token counter, random source failed");
    }
    return (static_cast<uint32_t>(b[0]) << 16) | (static_cast<uint32_t>(b[1]) << 8) |
           static_cast<uint32_t>(b[2]);
}

Identity IdentityResolver::resolve(IdentitySource& source)
{
    Identity identity;
    identity.machine_id = machine_id(source);
    identity.process_id = process_id(source);
    return identity;
}

} // namespace sigil::identity
