#pragma once

#include <optional>
#include <string>

namespace chunkpost {

enum class LinkClass {
    kWifi,
    kCellular,
    kEthernet,
    kVpn,
    kUnknown,
};

enum class CellularGeneration {
    kUnknown,
    k2G,
    k3G,
    k4G,
    k5G,
};

// Snapshot of the device's connectivity
struct NetworkState {
    bool connected = true;
    LinkClass link = LinkClass::kUnknown;
    CellularGeneration generation = CellularGeneration::kUnknown;
    std::optional<int> wifi_strength;   // 0..100
    std::optional<bool> costly;

    std::string toString() const;
};

const char* linkClassName(LinkClass link);
const char* generationName(CellularGeneration generation);

// Reports connectivity. Never fails: when unsure it answers connected/unknown.
class NetworkProbe {
public:
    virtual ~NetworkProbe() = default;

    virtual NetworkState probe() = 0;
};

// Reads /sys/class/net and /proc/net/wireless
class LinuxNetworkProbe : public NetworkProbe {
public:
    explicit LinuxNetworkProbe(std::string sys_class_net = "/sys/class/net",
                               std::string proc_net_wireless = "/proc/net/wireless");

    NetworkState probe() override;

private:
    std::string sys_class_net_;
    std::string proc_net_wireless_;

    std::optional<int> wirelessStrength(const std::string& interface_name) const;
};

// Fixed reading, for --network overrides and tests
class StaticNetworkProbe : public NetworkProbe {
public:
    explicit StaticNetworkProbe(NetworkState state) : state_(state) {}

    NetworkState probe() override { return state_; }

private:
    NetworkState state_;
};

// Parse "offline", "wifi", "wifi:75", "cellular:4g:cheap", "cellular:5g:costly", "ethernet", "vpn", "unknown"
bool parseNetworkSpec(const std::string& spec, NetworkState& state, std::string& error);

} // namespace chunkpost
