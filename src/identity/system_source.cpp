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
 * @file system_source.cpp
 * @brief Host-backed implementation of `IdentitySource`.
 */

#include "sigil/identity/identity.hpp"

#include <openssl/rand.h>

#include <climits>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <unistd.h>

#if defined(__FreeBSD__) || defined(__OpenBSD__)
#include <sys/types.h>
#include <sys/sysctl.h>
#endif

namespace sigil::identity {

namespace {

std::optional<std::string> read_file(const char* path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return content;
}

} // namespace

std::optional<std::string> SystemIdentitySource::platform_machine_id()
{
#if defined(__linux__)
    for (const char* path : {"/etc/machine-id", "/var/lib/dbus/machine-id"}) {
        auto content = read_file(path);
        if (content && !content->empty()) {
            return content;
        }
    }
    return std::nullopt;
#elif defined(__FreeBSD__)
    char buf[64] = {};
    size_t len = sizeof(buf) - 1;
    if (sysctlbyname("kern.hostuuid", buf, &len, nullptr, 0) != 0) {
        return std::nullopt;
    }
    return std::string(buf);
#elif defined(__OpenBSD__)
    int mib[2] = {CTL_HW, HW_UUID};
    char buf[64] = {};
    size_t len = sizeof(buf) - 1;
    if (sysctl(mib, 2, buf, &len, nullptr, 0) != 0) {
        return std::nullopt;
    }
    return std::string(buf);
#else
    return std::nullopt;
#endif
}

std::optional<std::string> SystemIdentitySource::host_name()
{
    char buf[256] = {};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return std::nullopt;
    }
    return std::string(buf);
}

bool SystemIdentitySource::random_bytes(uint8_t* dst, size_t size)
{
    if (size > static_cast<size_t>(INT_MAX)) {
        return false;
    }
    return RAND_bytes(dst, static_cast<int>(size)) == 1;
}

uint32_t SystemIdentitySource::process_id()
{
    return static_cast<uint32_t>(getpid());
}

std::optional<std::string> SystemIdentitySource::container_marker()
{
    return read_file("/proc/self/cpuset");
}

} // namespace sigil::identity
