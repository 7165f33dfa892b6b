/*
 * node.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-6

Description: Derive snowflake node ids from host identity

**************************************************/

#include "node.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <spdlog/spdlog.h>

#include "flake/id/hashcode.hpp"
#include "flake/id/layout.hpp"

#if defined(__linux__)
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>
#elif defined(_WIN32)
#include <process.h>
#else
#include <unistd.h>
#endif

namespace flake::system {

auto getHardwareAddress() -> std::optional<HardwareAddress> {
#if defined(__linux__)
    int fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_IP);
    if (fd == -1) {
        spdlog::debug("Failed to create socket for interface query: {}",
                      std::strerror(errno));
        return std::nullopt;
    }

    // Ensure socket is closed on exit
    struct SocketCloser {
        int fd;
        ~SocketCloser() {
            if (fd >= 0)
                close(fd);
        }
    } socketCloser{fd};

    struct ifreq ifr {};
    struct ifconf ifc {};
    char buf[1024];

    ifc.ifc_len = sizeof(buf);
    ifc.ifc_buf = buf;
    if (ioctl(fd, SIOCGIFCONF, &ifc) == -1) {
        spdlog::debug("SIOCGIFCONF failed: {}", std::strerror(errno));
        return std::nullopt;
    }

    struct ifreq *it = ifc.ifc_req;
    const struct ifreq *const end = it + (ifc.ifc_len / sizeof(struct ifreq));

    for (; it != end; ++it) {
        std::strncpy(ifr.ifr_name, it->ifr_name, IFNAMSIZ - 1);
        ifr.ifr_name[IFNAMSIZ - 1] = 0;

        if (ioctl(fd, SIOCGIFFLAGS, &ifr) != 0 ||
            (ifr.ifr_flags & IFF_LOOPBACK)) {
            continue;
        }
        if (ioctl(fd, SIOCGIFHWADDR, &ifr) == 0) {
            HardwareAddress mac{};
            for (std::size_t i = 0; i < mac.size(); ++i) {
                mac[i] = static_cast<u8>(ifr.ifr_hwaddr.sa_data[i]);
            }
            spdlog::debug("Using hardware address of interface {}",
                          ifr.ifr_name);
            return mac;
        }
    }
    spdlog::debug("No non-loopback interface with a hardware address");
#endif
    return std::nullopt;
}

auto currentProcessId() -> u64 {
#if defined(_WIN32)
    return static_cast<u64>(_getpid());
#else
    return static_cast<u64>(getpid());
#endif
}

auto workerIdFromProcess(u64 center_id, u64 pid, u64 max_worker_id) -> u64 {
    const std::string mpid = std::to_string(center_id) + std::to_string(pid);
    return (id::hashCode(mpid) & 0xFFFF) % (max_worker_id + 1);
}

auto deriveCenterId(u64 max_center_id) -> u64 {
    if (auto mac = getHardwareAddress()) {
        return centerIdFromHardwareAddress(*mac, max_center_id);
    }
    spdlog::warn("No hardware address available, using default center id {}",
                 id::Layout::DEFAULT_CENTER_ID);
    return id::Layout::DEFAULT_CENTER_ID % (max_center_id + 1);
}

auto deriveWorkerId(u64 center_id, u64 max_worker_id) -> u64 {
    return workerIdFromProcess(center_id, currentProcessId(), max_worker_id);
}

}  // namespace flake::system
