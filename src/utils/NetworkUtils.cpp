// Tapedeck - Network Utilities Implementation

#include "NetworkUtils.hpp"
#include "StringUtils.hpp"

#include <algorithm>
#include <fstream>

namespace tapedeck::utils {

namespace fs = std::filesystem;

namespace {

std::string readFirstLine(const fs::path& path) {
    std::ifstream file(path);
    std::string line;
    if (file.is_open()) {
        std::getline(file, line);
    }
    return StringUtils::trim(line);
}

} // namespace

std::vector<NetworkInterface> NetworkUtils::listInterfaces(const fs::path& sysfsNet) {
    std::vector<NetworkInterface> interfaces;

    std::error_code ec;
    for (auto it = fs::directory_iterator(sysfsNet, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        NetworkInterface iface;
        iface.name = it->path().filename().string();

        // operstate is "unknown" for some virtual links that still carry traffic
        auto state = readFirstLine(it->path() / "operstate");
        iface.up = state == "up" || (state == "unknown" && readFirstLine(it->path() / "carrier") == "1");

        std::error_code probeEc;
        iface.wireless = fs::exists(it->path() / "wireless", probeEc) ||
                         fs::exists(it->path() / "phy80211", probeEc) ||
                         StringUtils::startsWith(iface.name, "wl");
        iface.loopback = iface.name == "lo" || readFirstLine(it->path() / "type") == "772";

        interfaces.push_back(std::move(iface));
    }
    return interfaces;
}

bool NetworkUtils::canTransferNow(bool wifiOnly, const fs::path& sysfsNet) {
    auto interfaces = listInterfaces(sysfsNet);
    return std::any_of(interfaces.begin(), interfaces.end(), [wifiOnly](const NetworkInterface& iface) {
        return iface.up && !iface.loopback && (!wifiOnly || iface.wireless);
    });
}

} // namespace tapedeck::utils
