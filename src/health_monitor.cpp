#include "audiocache/health_monitor.hpp"
#include "audiocache/errors.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <condition_variable>
#include <exception>
#include <future>
#include <thread>

namespace audiocache {

namespace {

// "durable-store" -> "DurableStore", used as a metric name prefix.
std::string metric_prefix(const std::string& name) {
    std::string out;
    bool upper = true;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            upper = true;
            continue;
        }
        out.push_back(upper ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c);
        upper = false;
    }
    return out;
}

} // namespace

const char* DependencyKindName(DependencyKind kind) {
    switch (kind) {
        case DependencyKind::kSynthesis: return "synthesis";
        case DependencyKind::kDurableStore: return "durable-store";
        case DependencyKind::kEdgeDelivery: return "edge-delivery";
        case DependencyKind::kOther: return "other";
    }
    return "unknown";
}

const char* HealthStatusName(HealthStatus status) {
    switch (status) {
        case HealthStatus::kHealthy: return "healthy";
        case HealthStatus::kDegraded: return "degraded";
        case HealthStatus::kFailed: return "failed";
    }
    return "unknown";
}

struct DependencyHealthMonitor::Tracked {
    ProbeFn probe;

    // Held from a status decision until its observers have run, so Failed
    // and Recovered reach them in the order they happened.
    std::mutex notify_mutex;

    std::mutex mutex;  // guards the fields below
    DependencyHealth health;
    std::uint32_t recovery_streak = 0;
    bool awaiting_recovery = false;

    // At most one probe call in flight; a hung one is joined on destruction.
    std::mutex probe_mutex;
    std::thread probe_worker;
    std::shared_future<ProbeResult> probe_result;

    std::mutex wake_mutex;
    std::condition_variable wake;
    bool stop = false;
    std::thread thread;
};

DependencyHealthMonitor::DependencyHealthMonitor(Options options,
                                                 std::shared_ptr<MetricsRecorder> metrics)
    : options_(std::move(options)), metrics_(std::move(metrics)) {
    if (!metrics_) {
        metrics_ = std::make_shared<NullMetricsRecorder>();
    }
    if (options_.failure_threshold == 0) {
        throw ConfigurationError("failure_threshold must be at least 1");
    }
    if (options_.recovery_successes == 0) {
        throw ConfigurationError("recovery_successes must be at least 1");
    }
}

DependencyHealthMonitor::~DependencyHealthMonitor() {
    Stop();
    for (auto& kv : deps_) {
        Tracked& dep = *kv.second;
        std::lock_guard<std::mutex> lock(dep.probe_mutex);
        if (dep.probe_worker.joinable()) {
            dep.probe_worker.join();
        }
    }
}

void DependencyHealthMonitor::AddDependency(const std::string& name, DependencyKind kind, ProbeFn probe) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (running_) {
        throw Error("cannot add dependency '" + name + "' while monitoring is running");
    }
    if (deps_.count(name)) {
        throw Error("dependency '" + name + "' already registered");
    }
    auto dep = std::make_unique<Tracked>();
    dep->probe = std::move(probe);
    dep->health.name = name;
    dep->health.kind = kind;
    deps_.emplace(name, std::move(dep));
}

void DependencyHealthMonitor::AddObserver(HealthObserver* observer) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    observers_.push_back(observer);
}

void DependencyHealthMonitor::Start() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    for (auto& kv : deps_) {
        Tracked* dep = kv.second.get();
        {
            std::lock_guard<std::mutex> wake_lock(dep->wake_mutex);
            dep->stop = false;
        }
        dep->thread = std::thread(&DependencyHealthMonitor::probe_loop, this, dep);
    }
    spdlog::info("Starting health monitoring of {} dependencies every {} ms",
                 deps_.size(), options_.probe_interval.count());
}

void DependencyHealthMonitor::Stop() {
    std::vector<Tracked*> to_join;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        for (auto& kv : deps_) {
            to_join.push_back(kv.second.get());
        }
    }
    for (Tracked* dep : to_join) {
        {
            std::lock_guard<std::mutex> wake_lock(dep->wake_mutex);
            dep->stop = true;
        }
        dep->wake.notify_one();
    }
    for (Tracked* dep : to_join) {
        if (dep->thread.joinable()) {
            dep->thread.join();
        }
    }
}

void DependencyHealthMonitor::probe_loop(Tracked* dep) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(dep->wake_mutex);
            dep->wake.wait_for(lock, options_.probe_interval, [dep] { return dep->stop; });
            if (dep->stop) {
                break;
            }
        }
        try {
            RunProbe(dep->health.name);
        } catch (const std::exception& e) {
            spdlog::error("Health check failed for {}: {}", dep->health.name, e.what());
        }
    }
}

DependencyHealthMonitor::Tracked& DependencyHealthMonitor::tracked(const std::string& name) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = deps_.find(name);
    if (it == deps_.end()) {
        throw Error("unknown dependency '" + name + "'");
    }
    return *it->second;
}

ProbeResult DependencyHealthMonitor::run_with_timeout(Tracked& dep) {
    std::lock_guard<std::mutex> lock(dep.probe_mutex);
    if (dep.probe_worker.joinable()) {
        if (dep.probe_result.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
            return ProbeResult::Failure("previous probe still running");
        }
        dep.probe_worker.join();
    }

    const auto start = std::chrono::steady_clock::now();
    std::packaged_task<ProbeResult()> task(dep.probe);
    dep.probe_result = task.get_future().share();
    dep.probe_worker = std::thread(std::move(task));

    if (dep.probe_result.wait_for(options_.probe_timeout) != std::future_status::ready) {
        return ProbeResult::Failure("probe timed out after " +
                                    std::to_string(options_.probe_timeout.count()) + " ms");
    }

    ProbeResult result;
    try {
        result = dep.probe_result.get();
    } catch (const std::exception& e) {
        result = ProbeResult::Failure(e.what());
    }
    if (result.latency.count() == 0) {
        result.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    }
    return result;
}

DependencyHealth DependencyHealthMonitor::RunProbe(const std::string& name) {
    Tracked& dep = tracked(name);
    return RecordResult(name, run_with_timeout(dep));
}

DependencyHealth DependencyHealthMonitor::RecordResult(const std::string& name, const ProbeResult& result) {
    Tracked& dep = tracked(name);
    std::lock_guard<std::mutex> notify_lock(dep.notify_mutex);

    bool entered_failed = false;
    bool recovered = false;
    DependencyHealth snapshot;
    {
        std::lock_guard<std::mutex> lock(dep.mutex);
        DependencyHealth& h = dep.health;
        h.last_checked_ms = options_.clock();
        h.last_latency = result.latency;

        if (result.healthy) {
            h.consecutive_failures = 0;
            h.status = HealthStatus::kHealthy;
            h.last_error.clear();
            if (dep.awaiting_recovery && ++dep.recovery_streak >= options_.recovery_successes) {
                dep.awaiting_recovery = false;
                dep.recovery_streak = 0;
                recovered = true;
            }
        } else {
            const HealthStatus previous = h.status;
            dep.recovery_streak = 0;
            ++h.consecutive_failures;
            h.last_error = result.error;
            if (h.consecutive_failures >= options_.failure_threshold) {
                h.status = HealthStatus::kFailed;
                if (previous != HealthStatus::kFailed) {
                    entered_failed = true;
                    dep.awaiting_recovery = true;
                }
            } else {
                h.status = HealthStatus::kDegraded;
            }
        }
        snapshot = h;
    }

    const std::string prefix = metric_prefix(name);
    metrics_->Record(prefix + "HealthCheck", result.healthy ? 1.0 : 0.0, "Count");
    if (result.healthy) {
        metrics_->Record(prefix + "ResponseTime", static_cast<double>(result.latency.count()), "Milliseconds");
    } else {
        spdlog::warn("{} health check failed ({} consecutive, {}): {}", name,
                     snapshot.consecutive_failures, HealthStatusName(snapshot.status), result.error);
    }

    if (!entered_failed && !recovered) {
        return snapshot;
    }

    std::vector<HealthObserver*> observers;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        observers = observers_;
    }
    for (HealthObserver* observer : observers) {
        try {
            if (entered_failed) {
                observer->OnDependencyFailed(snapshot);
            } else {
                observer->OnDependencyRecovered(snapshot);
            }
        } catch (const std::exception& e) {
            spdlog::error("Health observer failed for {}: {}", name, e.what());
        }
    }
    return snapshot;
}

bool DependencyHealthMonitor::ProbeAll() {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto& kv : deps_) {
            names.push_back(kv.first);
        }
    }
    bool all_healthy = true;
    for (const auto& name : names) {
        all_healthy = (RunProbe(name).status == HealthStatus::kHealthy) && all_healthy;
    }
    metrics_->Record("SystemHealth", all_healthy ? 1.0 : 0.0, "Count");
    return all_healthy;
}

bool DependencyHealthMonitor::Tracks(const std::string& name) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return deps_.count(name) != 0;
}

std::optional<DependencyHealth> DependencyHealthMonitor::Get(const std::string& name) const {
    if (!Tracks(name)) {
        return std::nullopt;
    }
    Tracked& dep = tracked(name);
    std::lock_guard<std::mutex> lock(dep.mutex);
    return dep.health;
}

std::vector<DependencyHealth> DependencyHealthMonitor::Snapshot() const {
    std::vector<Tracked*> all;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (const auto& kv : deps_) {
            all.push_back(kv.second.get());
        }
    }
    std::vector<DependencyHealth> out;
    out.reserve(all.size());
    for (Tracked* dep : all) {
        std::lock_guard<std::mutex> lock(dep->mutex);
        out.push_back(dep->health);
    }
    return out;
}

Json::Value DependencyHealthMonitor::StatusJson() const {
    Json::Value root;
    root["timestamp"] = Json::Int64(options_.clock());
    Json::Value& services = root["services"];
    services = Json::Value(Json::objectValue);
    for (const auto& h : Snapshot()) {
        Json::Value& s = services[h.name];
        s["kind"] = DependencyKindName(h.kind);
        s["status"] = HealthStatusName(h.status);
        s["consecutiveFailures"] = Json::UInt(h.consecutive_failures);
        s["lastCheckedAt"] = Json::Int64(h.last_checked_ms);
        s["lastLatencyMs"] = Json::Int64(h.last_latency.count());
        if (!h.last_error.empty()) {
            s["lastError"] = h.last_error;
        }
    }
    return root;
}

} // namespace audiocache
