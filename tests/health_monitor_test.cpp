#include "audiocache/errors.hpp"
#include "audiocache/health_monitor.hpp"
#include "audiocache/health_probes.hpp"

#include "fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <thread>

using namespace audiocache;
using namespace std::chrono_literals;

namespace {

class CountingObserver : public HealthObserver {
public:
    void OnDependencyFailed(const DependencyHealth& health) override {
        failed++;
        last_failed_name = health.name;
    }
    void OnDependencyRecovered(const DependencyHealth&) override { recovered++; }

    std::atomic<int> failed{0};
    std::atomic<int> recovered{0};
    std::string last_failed_name;
};

class ThrowingObserver : public HealthObserver {
public:
    void OnDependencyFailed(const DependencyHealth&) override { throw std::runtime_error("observer bug"); }
    void OnDependencyRecovered(const DependencyHealth&) override {}
};

} // namespace

class HealthMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        healthy_ = std::make_shared<std::atomic<bool>>(true);
        metrics_ = std::make_shared<fakes::RecordingMetrics>();
    }

    std::unique_ptr<DependencyHealthMonitor> MakeMonitor(std::uint32_t threshold = 3,
                                                         std::uint32_t recovery = 1) {
        DependencyHealthMonitor::Options options;
        options.failure_threshold = threshold;
        options.recovery_successes = recovery;
        options.probe_timeout = 500ms;
        options.clock = clock_.Fn();
        auto monitor = std::make_unique<DependencyHealthMonitor>(options, metrics_);
        monitor->AddDependency("synthesis", DependencyKind::kSynthesis, SwitchableProbe());
        monitor->AddObserver(&observer_);
        return monitor;
    }

    ProbeFn SwitchableProbe() {
        auto healthy = healthy_;
        return [healthy] {
            return healthy->load() ? ProbeResult::Success(3ms) : ProbeResult::Failure("synthesis down");
        };
    }

    fakes::ManualClock clock_;
    std::shared_ptr<std::atomic<bool>> healthy_;
    std::shared_ptr<fakes::RecordingMetrics> metrics_;
    CountingObserver observer_;
};

TEST_F(HealthMonitorTest, StartsHealthy) {
    auto monitor = MakeMonitor();
    auto health = monitor->Get("synthesis");
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ(health->status, HealthStatus::kHealthy);
    EXPECT_EQ(health->consecutive_failures, 0u);
    EXPECT_FALSE(monitor->Get("unknown").has_value());
}

TEST_F(HealthMonitorTest, ThresholdFailuresEnterFailedExactlyOnce) {
    auto monitor = MakeMonitor(3);
    healthy_->store(false);

    EXPECT_EQ(monitor->RunProbe("synthesis").status, HealthStatus::kDegraded);
    EXPECT_EQ(monitor->RunProbe("synthesis").status, HealthStatus::kDegraded);
    EXPECT_EQ(observer_.failed.load(), 0);

    DependencyHealth third = monitor->RunProbe("synthesis");
    EXPECT_EQ(third.status, HealthStatus::kFailed);
    EXPECT_EQ(third.consecutive_failures, 3u);
    EXPECT_EQ(third.last_error, "synthesis down");
    EXPECT_EQ(observer_.failed.load(), 1);
    EXPECT_EQ(observer_.last_failed_name, "synthesis");

    monitor->RunProbe("synthesis");
    monitor->RunProbe("synthesis");
    EXPECT_EQ(observer_.failed.load(), 1);
}

TEST_F(HealthMonitorTest, SuccessResetsFailureCount) {
    auto monitor = MakeMonitor(3);
    healthy_->store(false);
    monitor->RunProbe("synthesis");
    monitor->RunProbe("synthesis");

    healthy_->store(true);
    DependencyHealth ok = monitor->RunProbe("synthesis");
    EXPECT_EQ(ok.status, HealthStatus::kHealthy);
    EXPECT_EQ(ok.consecutive_failures, 0u);
    EXPECT_EQ(ok.last_latency, 3ms);
    EXPECT_EQ(ok.last_checked_ms, clock_.Now());

    healthy_->store(false);
    monitor->RunProbe("synthesis");
    monitor->RunProbe("synthesis");
    EXPECT_EQ(monitor->Get("synthesis")->status, HealthStatus::kDegraded);
    EXPECT_EQ(observer_.failed.load(), 0);
}

TEST_F(HealthMonitorTest, RecoveryIsReportedAfterConfiguredSuccesses) {
    auto monitor = MakeMonitor(1, 2);
    healthy_->store(false);
    monitor->RunProbe("synthesis");
    ASSERT_EQ(observer_.failed.load(), 1);

    healthy_->store(true);
    monitor->RunProbe("synthesis");
    EXPECT_EQ(observer_.recovered.load(), 0);
    monitor->RunProbe("synthesis");
    EXPECT_EQ(observer_.recovered.load(), 1);

    // Healthy probes outside a failed episode report nothing.
    monitor->RunProbe("synthesis");
    EXPECT_EQ(observer_.recovered.load(), 1);
}

TEST_F(HealthMonitorTest, SlowProbeTimesOutAsFailure) {
    DependencyHealthMonitor::Options options;
    options.probe_timeout = 20ms;
    options.failure_threshold = 1;
    DependencyHealthMonitor monitor(options, metrics_);
    monitor.AddDependency("edge-delivery", DependencyKind::kEdgeDelivery, [] {
        std::this_thread::sleep_for(300ms);
        return ProbeResult::Success();
    });
    monitor.AddObserver(&observer_);

    DependencyHealth health = monitor.RunProbe("edge-delivery");
    EXPECT_EQ(health.status, HealthStatus::kFailed);
    EXPECT_NE(health.last_error.find("timed out"), std::string::npos);
    EXPECT_EQ(observer_.failed.load(), 1);
}

TEST_F(HealthMonitorTest, HungProbeBlocksFurtherProbesUntilItReturns) {
    DependencyHealthMonitor::Options options;
    options.probe_timeout = 50ms;
    options.failure_threshold = 5;
    DependencyHealthMonitor monitor(options, metrics_);

    auto calls = std::make_shared<std::atomic<int>>(0);
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    monitor.AddDependency("durable-store", DependencyKind::kDurableStore, [calls, gate] {
        if (calls->fetch_add(1) == 0) {
            gate.wait();
        }
        return ProbeResult::Success();
    });

    DependencyHealth health = monitor.RunProbe("durable-store");
    EXPECT_NE(health.last_error.find("timed out"), std::string::npos);

    health = monitor.RunProbe("durable-store");
    EXPECT_EQ(health.last_error, "previous probe still running");
    EXPECT_EQ(health.consecutive_failures, 2u);
    EXPECT_EQ(calls->load(), 1);

    release.set_value();
    for (int i = 0; i < 100 && health.status != HealthStatus::kHealthy; ++i) {
        std::this_thread::sleep_for(5ms);
        health = monitor.RunProbe("durable-store");
    }
    EXPECT_EQ(health.status, HealthStatus::kHealthy);
    EXPECT_EQ(calls->load(), 2);
}

TEST_F(HealthMonitorTest, ThrowingProbeCountsAsFailure) {
    DependencyHealthMonitor monitor(DependencyHealthMonitor::Options(), metrics_);
    monitor.AddDependency("durable-store", DependencyKind::kDurableStore,
                          []() -> ProbeResult { throw TransientDependencyError("connection refused"); });

    DependencyHealth health = monitor.RunProbe("durable-store");
    EXPECT_EQ(health.consecutive_failures, 1u);
    EXPECT_EQ(health.last_error, "connection refused");
}

TEST_F(HealthMonitorTest, ExternalResultsFeedTheSameCounter) {
    auto monitor = MakeMonitor(2);
    monitor->RecordResult("synthesis", ProbeResult::Failure("passive failure"));
    monitor->RecordResult("synthesis", ProbeResult::Failure("passive failure"));
    EXPECT_EQ(monitor->Get("synthesis")->status, HealthStatus::kFailed);
    EXPECT_EQ(observer_.failed.load(), 1);
}

TEST_F(HealthMonitorTest, RecordsPerDependencyMetrics) {
    auto monitor = MakeMonitor();
    monitor->RunProbe("synthesis");
    EXPECT_EQ(metrics_->Count("SynthesisHealthCheck"), 1);
    EXPECT_EQ(metrics_->Last("SynthesisHealthCheck"), 1.0);
    EXPECT_EQ(metrics_->Last("SynthesisResponseTime"), 3.0);

    healthy_->store(false);
    monitor->RunProbe("synthesis");
    EXPECT_EQ(metrics_->Last("SynthesisHealthCheck"), 0.0);
}

TEST_F(HealthMonitorTest, ProbeAllReportsOverallHealth) {
    auto monitor = MakeMonitor();
    monitor->AddDependency("durable-store", DependencyKind::kDurableStore, [] { return ProbeResult::Success(); });

    EXPECT_TRUE(monitor->ProbeAll());
    EXPECT_EQ(metrics_->Last("SystemHealth"), 1.0);

    healthy_->store(false);
    EXPECT_FALSE(monitor->ProbeAll());
    EXPECT_EQ(metrics_->Last("SystemHealth"), 0.0);

    Json::Value status = monitor->StatusJson();
    EXPECT_EQ(status["services"]["synthesis"]["status"].asString(), "degraded");
    EXPECT_EQ(status["services"]["durable-store"]["status"].asString(), "healthy");
    EXPECT_EQ(status["services"]["synthesis"]["lastError"].asString(), "synthesis down");
}

TEST_F(HealthMonitorTest, BackgroundProbesDriveStatus) {
    DependencyHealthMonitor::Options options;
    options.probe_interval = 5ms;
    options.failure_threshold = 3;
    DependencyHealthMonitor monitor(options, metrics_);
    monitor.AddDependency("synthesis", DependencyKind::kSynthesis, SwitchableProbe());
    monitor.AddObserver(&observer_);
    healthy_->store(false);

    monitor.Start();
    for (int i = 0; i < 400 && observer_.failed.load() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    monitor.Stop();

    EXPECT_EQ(observer_.failed.load(), 1);
    EXPECT_EQ(monitor.Get("synthesis")->status, HealthStatus::kFailed);
}

TEST_F(HealthMonitorTest, ObserverExceptionsAreContained) {
    auto monitor = MakeMonitor(1);
    ThrowingObserver throwing;
    monitor->AddObserver(&throwing);
    healthy_->store(false);

    EXPECT_NO_THROW(monitor->RunProbe("synthesis"));
    EXPECT_EQ(observer_.failed.load(), 1);
}

TEST_F(HealthMonitorTest, RejectsUnknownAndDuplicateDependencies) {
    auto monitor = MakeMonitor();
    EXPECT_THROW(monitor->RunProbe("nope"), Error);
    EXPECT_THROW(monitor->AddDependency("synthesis", DependencyKind::kSynthesis, SwitchableProbe()), Error);
    EXPECT_TRUE(monitor->Tracks("synthesis"));
    EXPECT_FALSE(monitor->Tracks("nope"));
}

TEST(HealthMonitorConfigTest, RejectsZeroThreshold) {
    DependencyHealthMonitor::Options options;
    options.failure_threshold = 0;
    EXPECT_THROW({ DependencyHealthMonitor monitor(options, nullptr); }, ConfigurationError);
}

TEST(HealthProbesTest, ProbesExerciseTheirCollaborators) {
    auto synthesis = std::make_shared<fakes::FakeSynthesis>();
    auto storage = std::make_shared<fakes::FakeObjectStorage>();
    auto edge = std::make_shared<fakes::FakeEdge>();

    EXPECT_TRUE(MakeSynthesisProbe(synthesis)().healthy);
    EXPECT_EQ(synthesis->calls(), 1);
    // A missing probe object still proves the store is answering.
    EXPECT_TRUE(MakeStorageProbe(storage)().healthy);
    EXPECT_EQ(storage->heads(), 1);
    EXPECT_TRUE(MakeEdgeProbe(edge)().healthy);

    synthesis->SetFailing(true);
    storage->SetUnavailable(true);
    edge->SetReachable(false);
    EXPECT_FALSE(MakeSynthesisProbe(synthesis)().healthy);
    EXPECT_FALSE(MakeStorageProbe(storage)().healthy);
    ProbeResult edge_result = MakeEdgeProbe(edge)();
    EXPECT_FALSE(edge_result.healthy);
    EXPECT_FALSE(edge_result.error.empty());
}
