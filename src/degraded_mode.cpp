#include "audiocache/degraded_mode.hpp"

#include <sstream>

namespace audiocache {

const char* SynthesisModeName(SynthesisMode mode) {
    switch (mode) {
        case SynthesisMode::kPrimary: return "primary";
        case SynthesisMode::kAlternate: return "alternate";
        case SynthesisMode::kCacheOnly: return "cache_only";
    }
    return "unknown";
}

std::string DegradedModeFlags::Describe() const {
    std::ostringstream out;
    out << "synthesis=" << SynthesisModeName(synthesis_mode())
        << " remote=" << (RemoteBypassed() ? "bypassed" : "active")
        << " edge=" << (EdgeBypassed() ? "bypassed" : "active");
    return out.str();
}

} // namespace audiocache
