#include "audiocache/types.hpp"

namespace audiocache {

const char* TierName(Tier tier) {
    switch (tier) {
        case Tier::kMemory: return "memory";
        case Tier::kDisk: return "disk";
        case Tier::kRemote: return "remote";
    }
    return "unknown";
}

const char* HitSourceName(HitSource source) {
    switch (source) {
        case HitSource::kMemory: return "memory";
        case HitSource::kDisk: return "disk";
        case HitSource::kRemote: return "remote";
        case HitSource::kGenerated: return "generated";
    }
    return "unknown";
}

HitSource HitSourceFor(Tier tier) {
    switch (tier) {
        case Tier::kMemory: return HitSource::kMemory;
        case Tier::kDisk: return HitSource::kDisk;
        case Tier::kRemote: return HitSource::kRemote;
    }
    return HitSource::kGenerated;
}

} // namespace audiocache
