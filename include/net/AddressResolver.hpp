#pragma once

#include "util/Result.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace reelcast::net {

/**
 * Works out where the remote device can reach us: the LAN-facing IPv4
 * address and a free local TCP port for each transfer's HTTP server.
 *
 * Claimed ports are remembered until released so two sessions never get
 * the same port, even before either process has bound it.
 */
class AddressResolver {
public:
    // `fixed_address` pins the advertised address (multi-homed hosts, tests)
    explicit AddressResolver(std::optional<std::string> fixed_address = std::nullopt);

    std::string lan_address();

    // `preferred` == 0 picks any free port
    util::Result<uint16_t> claim_port(uint16_t preferred = 0);
    void release_port(uint16_t port);
    bool is_claimed(uint16_t port) const;
    size_t claimed_count() const;

    static std::string format_url(const std::string& host, uint16_t port, const std::string& path);

private:
    static std::optional<std::string> detect_by_route();
    static std::optional<std::string> detect_by_interfaces();
    static bool port_is_free(uint16_t port);
    static std::optional<uint16_t> ephemeral_port();

    std::optional<std::string> fixed_address_;
    std::optional<std::string> cached_address_;
    std::set<uint16_t> claimed_;
    mutable std::mutex mutex_;
};

}  // namespace reelcast::net
