// Tapedeck - Network Utilities
// Connectivity probe backing the Wi-Fi only download policy

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tapedeck::utils {

/**
 * @brief Network interface state as reported by the kernel
 */
struct NetworkInterface {
    std::string name;
    bool up{false};
    bool wireless{false};
    bool loopback{false};
};

/**
 * @brief Linux sysfs based connectivity checks
 */
class NetworkUtils {
public:
    /**
     * @brief Enumerate interfaces under sysfsNet (one directory per interface)
     */
    static std::vector<NetworkInterface> listInterfaces(const std::filesystem::path& sysfsNet = "/sys/class/net");

    /**
     * @brief Network policy predicate
     * @param wifiOnly Require a wireless interface that is up
     * @return true if a suitable non-loopback interface is up
     */
    static bool canTransferNow(bool wifiOnly, const std::filesystem::path& sysfsNet = "/sys/class/net");
};

} // namespace tapedeck::utils
