#include "network_probe.h"
#include "utils.h"
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace chunkpost {

namespace fs = std::filesystem;

namespace {

bool hasPrefix(const std::string& value, const char* prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string readFirstLine(const fs::path& path) {
    std::string content;
    if (!Utils::readFile(path.string(), content)) {
        return "";
    }
    size_t end = content.find('\n');
    return Utils::trim(end == std::string::npos ? content : content.substr(0, end));
}

// Higher wins when several interfaces are up
int linkRank(LinkClass link) {
    switch (link) {
        case LinkClass::kEthernet: return 4;
        case LinkClass::kWifi: return 3;
        case LinkClass::kCellular: return 2;
        case LinkClass::kVpn: return 1;
        case LinkClass::kUnknown: return 0;
    }
    return 0;
}

} // namespace

const char* linkClassName(LinkClass link) {
    switch (link) {
        case LinkClass::kWifi: return "wifi";
        case LinkClass::kCellular: return "cellular";
        case LinkClass::kEthernet: return "ethernet";
        case LinkClass::kVpn: return "vpn";
        case LinkClass::kUnknown: return "unknown";
    }
    return "unknown";
}

const char* generationName(CellularGeneration generation) {
    switch (generation) {
        case CellularGeneration::k2G: return "2g";
        case CellularGeneration::k3G: return "3g";
        case CellularGeneration::k4G: return "4g";
        case CellularGeneration::k5G: return "5g";
        case CellularGeneration::kUnknown: return "null";
    }
    return "null";
}

std::string NetworkState::toString() const {
    std::stringstream ss;
    ss << "connected=" << (connected ? "true" : "false")
       << " class=" << linkClassName(link)
       << " cellularGen=" << generationName(generation)
       << " wifiStrength=" << (wifi_strength ? std::to_string(*wifi_strength) : "null")
       << " costly=" << (costly ? (*costly ? "true" : "false") : "null");
    return ss.str();
}

LinuxNetworkProbe::LinuxNetworkProbe(std::string sys_class_net, std::string proc_net_wireless)
    : sys_class_net_(std::move(sys_class_net)), proc_net_wireless_(std::move(proc_net_wireless)) {
}

NetworkState LinuxNetworkProbe::probe() {
    NetworkState fallback;
    NetworkState best;
    best.connected = false;
    bool found_interface = false;

    std::error_code ec;
    fs::directory_iterator it(sys_class_net_, ec);
    if (ec) {
        Utils::logDebug("Network probe cannot read " + sys_class_net_ + ": " + ec.message());
        return fallback;
    }

    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (name == "lo") {
            continue;
        }
        found_interface = true;

        std::string operstate = readFirstLine(entry.path() / "operstate");
        // Some drivers never leave operstate "unknown"
        if (operstate != "up" && operstate != "unknown") {
            continue;
        }

        NetworkState candidate;
        candidate.connected = true;
        if (fs::exists(entry.path() / "wireless", ec)) {
            candidate.link = LinkClass::kWifi;
            candidate.wifi_strength = wirelessStrength(name);
            candidate.costly = false;
        } else if (hasPrefix(name, "wwan") || hasPrefix(name, "rmnet") || hasPrefix(name, "ppp")) {
            candidate.link = LinkClass::kCellular;
            candidate.costly = true;
        } else if (hasPrefix(name, "tun") || hasPrefix(name, "wg") || hasPrefix(name, "tap")) {
            candidate.link = LinkClass::kVpn;
        } else {
            candidate.link = LinkClass::kEthernet;
            candidate.costly = false;
        }

        if (!best.connected || linkRank(candidate.link) > linkRank(best.link)) {
            best = candidate;
        }
    }

    if (!found_interface) {
        return fallback;
    }
    return best;
}

std::optional<int> LinuxNetworkProbe::wirelessStrength(const std::string& interface_name) const {
    std::string content;
    if (!Utils::readFile(proc_net_wireless_, content)) {
        return std::nullopt;
    }

    // Inter-| sta-|   Quality        |   Discarded packets ...
    //  face | tus | link level noise |  nwid  crypt   frag  retry   misc | beacon | 22
    //  wlan0: 0000   54.  -56.  -256        0      0      0      0     30        0
    for (const auto& line : Utils::splitString(content, '\n')) {
        std::string trimmed = Utils::trim(line);
        if (!hasPrefix(trimmed, (interface_name + ":").c_str())) {
            continue;
        }
        std::istringstream fields(trimmed.substr(interface_name.size() + 1));
        std::string status;
        double link_quality = 0;
        if (!(fields >> status >> link_quality)) {
            return std::nullopt;
        }
        // Link quality is reported out of 70
        int strength = static_cast<int>(link_quality * 100.0 / 70.0 + 0.5);
        return std::max(0, std::min(100, strength));
    }
    return std::nullopt;
}

bool parseNetworkSpec(const std::string& spec, NetworkState& state, std::string& error) {
    std::vector<std::string> parts = Utils::splitString(Utils::toLower(Utils::trim(spec)), ':');
    if (parts.empty() || parts[0].empty()) {
        error = "Empty network spec";
        return false;
    }

    NetworkState parsed;
    const std::string& kind = parts[0];
    if (kind == "offline") {
        parsed.connected = false;
        parsed.link = LinkClass::kUnknown;
    } else if (kind == "wifi") {
        parsed.link = LinkClass::kWifi;
        if (parts.size() > 1) {
            try {
                size_t consumed = 0;
                int strength = std::stoi(parts[1], &consumed);
                if (consumed != parts[1].size() || strength < 0 || strength > 100) {
                    error = "Wifi strength must be 0..100: " + parts[1];
                    return false;
                }
                parsed.wifi_strength = strength;
            } catch (const std::exception&) {
                error = "Invalid wifi strength: " + parts[1];
                return false;
            }
        }
    } else if (kind == "cellular") {
        parsed.link = LinkClass::kCellular;
        for (size_t i = 1; i < parts.size(); ++i) {
            const std::string& token = parts[i];
            if (token == "2g") parsed.generation = CellularGeneration::k2G;
            else if (token == "3g") parsed.generation = CellularGeneration::k3G;
            else if (token == "4g") parsed.generation = CellularGeneration::k4G;
            else if (token == "5g") parsed.generation = CellularGeneration::k5G;
            else if (token == "cheap") parsed.costly = false;
            else if (token == "costly") parsed.costly = true;
            else {
                error = "Unknown cellular attribute: " + token;
                return false;
            }
        }
    } else if (kind == "ethernet") {
        parsed.link = LinkClass::kEthernet;
    } else if (kind == "vpn") {
        parsed.link = LinkClass::kVpn;
    } else if (kind == "unknown") {
        parsed.link = LinkClass::kUnknown;
    } else {
        error = "Unknown network class: " + kind;
        return false;
    }

    if (kind != "wifi" && kind != "cellular" && parts.size() > 1) {
        error = "Unexpected attributes for " + kind;
        return false;
    }

    state = parsed;
    return true;
}

} // namespace chunkpost
