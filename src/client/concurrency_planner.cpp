#include "concurrency_planner.h"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace chunkpost {

namespace {

constexpr size_t KIB = 1024;

// Cost flag left unknown counts as metered
bool isCostly(const NetworkState& state) {
    return state.costly.value_or(true);
}

} // namespace

bool parseNetworkPreference(const std::string& value, NetworkPreference& preference) {
    std::string lowered = Utils::toLower(Utils::trim(value));
    if (lowered == "any" || lowered.empty()) {
        preference = NetworkPreference::kAny;
    } else if (lowered == "wifi") {
        preference = NetworkPreference::kWifi;
    } else if (lowered == "cellular") {
        preference = NetworkPreference::kCellular;
    } else {
        return false;
    }
    return true;
}

const char* networkPreferenceName(NetworkPreference preference) {
    switch (preference) {
        case NetworkPreference::kAny: return "any";
        case NetworkPreference::kWifi: return "wifi";
        case NetworkPreference::kCellular: return "cellular";
    }
    return "any";
}

std::string UploadPlan::toString() const {
    std::stringstream ss;
    if (!ok) {
        ss << "refused (" << refusal << "): " << reason;
    } else {
        ss << "workers=" << workers << " baseChunkBytes=" << base_chunk_bytes
           << " effectiveClass=" << linkClassName(effective_link);
    }
    return ss.str();
}

UploadPlan ConcurrencyPlanner::plan(const NetworkState& state, NetworkPreference preference) {
    UploadPlan result;

    if (!state.connected) {
        result.refusal = "offline";
        result.reason = "No network connection. Please connect and try again.";
        return result;
    }

    if (preference == NetworkPreference::kWifi && state.link != LinkClass::kWifi) {
        result.refusal = "wifi-only required";
        result.reason = "Uploads are set to Wi-Fi only. Connect to Wi-Fi or change the network preference.";
        return result;
    }

    // A cellular preference never refuses; it only re-tags the link for the heuristics
    LinkClass effective = state.link;
    if (preference == NetworkPreference::kWifi) {
        effective = LinkClass::kWifi;
    } else if (preference == NetworkPreference::kCellular) {
        effective = LinkClass::kCellular;
    }

    result.ok = true;
    result.effective_link = effective;
    result.workers = chooseWorkers(effective, state);
    result.base_chunk_bytes = chooseChunkBytes(effective, state, result.workers);

    Utils::logInfo("Upload plan: preference=" + std::string(networkPreferenceName(preference)) + " " +
                   state.toString() + " -> " + result.toString());
    return result;
}

int ConcurrencyPlanner::chooseWorkers(LinkClass effective_link, const NetworkState& state) {
    int workers = 1;

    if (effective_link == LinkClass::kWifi) {
        if (state.wifi_strength) {
            int strength = *state.wifi_strength;
            if (strength >= 70) {
                workers = 4;
            } else if (strength >= 40) {
                workers = 3;
            } else {
                workers = 2;
            }
        } else {
            workers = 4;
        }
    } else if (effective_link == LinkClass::kCellular) {
        switch (state.generation) {
            case CellularGeneration::k5G:
                workers = 4;
                break;
            case CellularGeneration::k4G:
                workers = isCostly(state) ? 2 : 3;
                break;
            case CellularGeneration::k3G:
                workers = 2;
                break;
            default:
                workers = 1;
                break;
        }
    } else {
        workers = 2;
    }

    return std::max(1, std::min(MAX_WORKERS, workers));
}

size_t ConcurrencyPlanner::chooseChunkBytes(LinkClass effective_link, const NetworkState& state, int workers) {
    size_t base = MIN_CHUNK_BYTES;

    if (effective_link == LinkClass::kWifi) {
        if (state.wifi_strength) {
            int strength = *state.wifi_strength;
            if (strength >= 70) {
                base = 512 * KIB;
            } else if (strength >= 40) {
                base = 256 * KIB;
            } else {
                base = 192 * KIB;
            }
        } else {
            base = 512 * KIB;
        }
    } else if (effective_link == LinkClass::kCellular) {
        switch (state.generation) {
            case CellularGeneration::k5G:
                base = 512 * KIB;
                break;
            case CellularGeneration::k4G:
                base = isCostly(state) ? 256 * KIB : 384 * KIB;
                break;
            case CellularGeneration::k3G:
                base = 192 * KIB;
                break;
            default:
                base = 128 * KIB;
                break;
        }
    } else {
        base = 256 * KIB;
    }

    static const double kMultiplierByWorkers[] = {1.0, 1.0, 1.25, 1.5, 2.0};
    int clamped_workers = std::max(1, std::min(MAX_WORKERS, workers));
    double scaled = std::round(static_cast<double>(base) * kMultiplierByWorkers[clamped_workers]);

    size_t bytes = static_cast<size_t>(scaled);
    return std::max(MIN_CHUNK_BYTES, std::min(MAX_CHUNK_BYTES, bytes));
}

} // namespace chunkpost
