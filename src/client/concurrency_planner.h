#pragma once

#include "network_probe.h"
#include <cstddef>
#include <string>

namespace chunkpost {

enum class NetworkPreference {
    kAny,
    kWifi,
    kCellular,
};

bool parseNetworkPreference(const std::string& value, NetworkPreference& preference);
const char* networkPreferenceName(NetworkPreference preference);

// Planner decision for one upload batch
struct UploadPlan {
    bool ok = false;
    std::string refusal;      // "offline" or "wifi-only required" when !ok
    std::string reason;       // user-visible explanation
    int workers = 1;
    size_t base_chunk_bytes = 0;
    LinkClass effective_link = LinkClass::kUnknown;

    std::string toString() const;
};

// Maps a probe reading and the user's preference to parallelism and chunk size
class ConcurrencyPlanner {
public:
    static UploadPlan plan(const NetworkState& state, NetworkPreference preference);

    static int chooseWorkers(LinkClass effective_link, const NetworkState& state);
    static size_t chooseChunkBytes(LinkClass effective_link, const NetworkState& state, int workers);
};

} // namespace chunkpost
