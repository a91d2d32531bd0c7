#pragma once

#include <atomic>
#include <string>

namespace audiocache {

enum class SynthesisMode {
    kPrimary,    // normal provider
    kAlternate,  // fallback provider instance
    kCacheOnly,  // generation disabled, serve hits only
};

const char* SynthesisModeName(SynthesisMode mode);

/**
 * @class DegradedModeFlags
 * @brief Process-wide operating mode, one flag per dependency.
 *
 * Created once at startup and passed by reference to everything that must
 * honour it. Reads are lock-free atomic loads. Only FailoverController
 * writes, and it serializes its writes.
 */
class DegradedModeFlags {
public:
    DegradedModeFlags() = default;

    SynthesisMode synthesis_mode() const { return synthesis_.load(std::memory_order_acquire); }
    bool RemoteBypassed() const { return remote_bypassed_.load(std::memory_order_acquire); }
    bool EdgeBypassed() const { return edge_bypassed_.load(std::memory_order_acquire); }

    bool IsNormal() const {
        return synthesis_mode() == SynthesisMode::kPrimary && !RemoteBypassed() && !EdgeBypassed();
    }

    std::string Describe() const;

private:
    friend class FailoverController;

    void set_synthesis_mode(SynthesisMode mode) { synthesis_.store(mode, std::memory_order_release); }
    void set_remote_bypassed(bool v) { remote_bypassed_.store(v, std::memory_order_release); }
    void set_edge_bypassed(bool v) { edge_bypassed_.store(v, std::memory_order_release); }

    std::atomic<SynthesisMode> synthesis_{SynthesisMode::kPrimary};
    std::atomic<bool> remote_bypassed_{false};
    std::atomic<bool> edge_bypassed_{false};

    DegradedModeFlags(const DegradedModeFlags&) = delete;
    DegradedModeFlags& operator=(const DegradedModeFlags&) = delete;
};

} // namespace audiocache
