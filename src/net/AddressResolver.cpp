#include "net/AddressResolver.hpp"
#include "util/Logger.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace reelcast::net {

AddressResolver::AddressResolver(std::optional<std::string> fixed_address)
    : fixed_address_(std::move(fixed_address)) {
    if (fixed_address_ && fixed_address_->empty()) {
        fixed_address_.reset();
    }
}

std::string AddressResolver::lan_address() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fixed_address_) return *fixed_address_;
    if (cached_address_) return *cached_address_;

    auto found = detect_by_route();
    if (!found) found = detect_by_interfaces();
    if (!found) {
        util::Logger::warn("AddressResolver: No LAN address found, falling back to 127.0.0.1");
        return "127.0.0.1";
    }
    util::Logger::info("AddressResolver: LAN address " + *found);
    cached_address_ = found;
    return *found;
}

// A connected UDP socket sends nothing, but the kernel picks the source
// address of the default route, which is the one the LAN sees
std::optional<std::string> AddressResolver::detect_by_route() {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return std::nullopt;

    sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(53);
    ::inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    std::optional<std::string> result;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) == 0) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
            char buf[INET_ADDRSTRLEN] = {0};
            if (::inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf)) &&
                local.sin_addr.s_addr != htonl(INADDR_ANY) &&
                local.sin_addr.s_addr != htonl(INADDR_LOOPBACK)) {
                result = std::string(buf);
            }
        }
    }
    ::close(fd);
    return result;
}

std::optional<std::string> AddressResolver::detect_by_interfaces() {
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) return std::nullopt;

    std::optional<std::string> result;
    for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) continue;

        auto* addr = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        char buf[INET_ADDRSTRLEN] = {0};
        if (::inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf))) {
            result = std::string(buf);
            break;
        }
    }
    ::freeifaddrs(list);
    return result;
}

bool AddressResolver::port_is_free(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    int reuse = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    bool ok = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return ok;
}

std::optional<uint16_t> AddressResolver::ephemeral_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return std::nullopt;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = 0;

    std::optional<uint16_t> result;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        socklen_t len = sizeof(addr);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            result = ntohs(addr.sin_port);
        }
    }
    ::close(fd);
    return result;
}

util::Result<uint16_t> AddressResolver::claim_port(uint16_t preferred) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (preferred != 0) {
        if (!claimed_.count(preferred) && port_is_free(preferred)) {
            claimed_.insert(preferred);
            util::Logger::debug("AddressResolver: Claimed preferred port " + std::to_string(preferred));
            return util::Result<uint16_t>::ok(preferred);
        }
        util::Logger::info("AddressResolver: Port " + std::to_string(preferred) +
            " busy, picking another");
    }

    for (int attempt = 0; attempt < 16; ++attempt) {
        auto port = ephemeral_port();
        if (!port) break;
        if (claimed_.count(*port)) continue;
        claimed_.insert(*port);
        util::Logger::debug("AddressResolver: Claimed port " + std::to_string(*port));
        return util::Result<uint16_t>::ok(*port);
    }
    return util::Result<uint16_t>::err(util::ErrorCode::IoError, "no free local port available");
}

void AddressResolver::release_port(uint16_t port) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (claimed_.erase(port)) {
        util::Logger::debug("AddressResolver: Released port " + std::to_string(port));
    }
}

bool AddressResolver::is_claimed(uint16_t port) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.count(port) > 0;
}

size_t AddressResolver::claimed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return claimed_.size();
}

std::string AddressResolver::format_url(const std::string& host, uint16_t port, const std::string& path) {
    std::string h = host;
    if (h.find(':') != std::string::npos && h.front() != '[') {
        h = "[" + h + "]";  // IPv6 literal
    }
    std::string p = path;
    if (!p.empty() && p.front() == '/') p.erase(0, 1);
    return "http://" + h + ":" + std::to_string(port) + "/" + p;
}

}  // namespace reelcast::net
