// BitsAgent Unit Tests - Job monitor
// Tests: snapshot timing, notification wake-up, priority handling, URL change reporting, shutdown

#include <gtest/gtest.h>
#include "service/job_monitor.h"
#include "fake_transfer_service.h"
#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using namespace bitsagent;
using namespace std::chrono;

// ============================================================
// JobMonitorTest
// ============================================================

class JobMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<fake::FakeBackend>();
        record_ = backend_->AddJob(DEFAULT_JOB_NAME);
    }

    std::unique_ptr<JobMonitor> MakeMonitor(DWORD intervalMs) {
        fake::FakeTransferJob job(backend_, record_);
        std::unique_ptr<JobMonitor> monitor;
        EXPECT_EQ(JobMonitor::Create(backend_->Factory(), job, record_->id, intervalMs, monitor), S_OK);
        return monitor;
    }

    int NormalCount() {
        return backend_->With(record_->id, [](fake::FakeJob& j) { return j.normalCount; });
    }

    static milliseconds Since(steady_clock::time_point start) {
        return duration_cast<milliseconds>(steady_clock::now() - start);
    }

    std::shared_ptr<fake::FakeBackend> backend_;
    std::shared_ptr<fake::FakeJob> record_;
};

TEST_F(JobMonitorTest, CreateRaisesPriorityAndRegistersHandlers) {
    auto monitor = MakeMonitor(1000);
    ASSERT_TRUE(monitor);
    EXPECT_EQ(record_->priority, JobPriority::Foreground);
    EXPECT_EQ(record_->foregroundCount, 1);
    EXPECT_TRUE(static_cast<bool>(record_->handlers.transferred));
    EXPECT_TRUE(static_cast<bool>(record_->handlers.error));
    EXPECT_FALSE(static_cast<bool>(record_->handlers.modification));
}

TEST_F(JobMonitorTest, CreateFailsWhenPriorityRejected) {
    record_->setPriorityResult = E_ACCESSDENIED;
    fake::FakeTransferJob job(backend_, record_);
    std::unique_ptr<JobMonitor> monitor;
    EXPECT_EQ(JobMonitor::Create(backend_->Factory(), job, record_->id, 1000, monitor), E_ACCESSDENIED);
    EXPECT_FALSE(monitor);
    EXPECT_EQ(record_->normalCount, 0);
}

TEST_F(JobMonitorTest, FirstStatusIsImmediate) {
    auto monitor = MakeMonitor(1000);
    JobStatus status;
    auto start = steady_clock::now();
    MonitorResult result = monitor->GetStatus(5000, status);
    EXPECT_FALSE(result);
    EXPECT_LT(Since(start).count(), 500);
}

TEST_F(JobMonitorTest, LaterStatusWaitsForInterval) {
    auto monitor = MakeMonitor(1000);
    JobStatus status;
    ASSERT_FALSE(monitor->GetStatus(5000, status));

    auto start = steady_clock::now();
    ASSERT_FALSE(monitor->GetStatus(5000, status));
    auto elapsed = Since(start).count();
    EXPECT_GE(elapsed, 900);
    EXPECT_LT(elapsed, 2000);
}

TEST_F(JobMonitorTest, NotificationWakesEarly) {
    auto monitor = MakeMonitor(10000);
    JobStatus status;
    ASSERT_FALSE(monitor->GetStatus(INFINITE, status));

    std::thread notifier([this]() {
        std::this_thread::sleep_for(milliseconds(100));
        EXPECT_EQ(backend_->FireTransferred(record_->id), S_OK);
    });

    auto start = steady_clock::now();
    MonitorResult result = monitor->GetStatus(INFINITE, status);
    auto elapsed = Since(start).count();
    notifier.join();

    EXPECT_FALSE(result);
    EXPECT_GE(elapsed, 80);
    EXPECT_LT(elapsed, 2000);
}

TEST_F(JobMonitorTest, ErrorNotificationAlsoWakes) {
    auto monitor = MakeMonitor(10000);
    JobStatus status;
    ASSERT_FALSE(monitor->GetStatus(INFINITE, status));

    EXPECT_EQ(backend_->FireError(record_->id), S_OK);
    auto start = steady_clock::now();
    EXPECT_FALSE(monitor->GetStatus(INFINITE, status));
    EXPECT_LT(Since(start).count(), 1000);
}

TEST_F(JobMonitorTest, NewIntervalAppliesToCurrentWait) {
    auto monitor = MakeMonitor(10000);
    MonitorControl control = monitor->GetControl();
    JobStatus status;
    ASSERT_FALSE(monitor->GetStatus(INFINITE, status));

    std::thread changer([&control]() {
        std::this_thread::sleep_for(milliseconds(100));
        EXPECT_TRUE(control.SetInterval(200));
    });

    auto start = steady_clock::now();
    EXPECT_FALSE(monitor->GetStatus(INFINITE, status));
    changer.join();
    EXPECT_LT(Since(start).count(), 2000);
}

TEST_F(JobMonitorTest, TimeoutShutsDown) {
    auto monitor = MakeMonitor(10000);
    JobStatus status;
    ASSERT_FALSE(monitor->GetStatus(INFINITE, status));

    MonitorResult result = monitor->GetStatus(100, status);
    EXPECT_EQ(result.kind, MonitorResultKind::Timeout);

    result = monitor->GetStatus(INFINITE, status);
    EXPECT_EQ(result.kind, MonitorResultKind::NotConnected);
    EXPECT_EQ(NormalCount(), 1);
}

TEST_F(JobMonitorTest, StopWakesBlockedCaller) {
    auto monitor = MakeMonitor(10000);
    MonitorControl control = monitor->GetControl();
    JobStatus status;
    ASSERT_FALSE(monitor->GetStatus(INFINITE, status));

    std::thread stopper([&control]() {
        std::this_thread::sleep_for(milliseconds(100));
        EXPECT_TRUE(control.Stop());
    });

    MonitorResult result = monitor->GetStatus(INFINITE, status);
    stopper.join();
    EXPECT_EQ(result.kind, MonitorResultKind::NotConnected);
}

TEST_F(JobMonitorTest, PriorityRestoredExactlyOnce) {
    auto monitor = MakeMonitor(1000);
    JobStatus status;
    ASSERT_FALSE(monitor->GetStatus(INFINITE, status));

    monitor->Stop();
    EXPECT_EQ(NormalCount(), 1);
    EXPECT_EQ(monitor->GetStatus(INFINITE, status).kind, MonitorResultKind::NotConnected);
    monitor->Stop();
    monitor.reset();
    EXPECT_EQ(NormalCount(), 1);
    EXPECT_EQ(record_->priority, JobPriority::Normal);
}

TEST_F(JobMonitorTest, SupersededMonitorKeepsPriority) {
    auto monitor = MakeMonitor(1000);
    EXPECT_TRUE(monitor->GetControl().Supersede());
    monitor.reset();
    EXPECT_EQ(record_->normalCount, 0);
    EXPECT_EQ(record_->priority, JobPriority::Foreground);
}

TEST_F(JobMonitorTest, SupersedeWaitsForRestoreInProgress) {
    // The first service connection (the restore) blocks until released
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> gated{true};
    TransferServiceFactory inner = backend_->Factory();
    TransferServiceFactory gate = [&entered, &gated, released, inner](
            std::unique_ptr<TransferService>& service) {
        if (gated.exchange(false)) {
            entered.set_value();
            released.wait();
        }
        return inner(service);
    };

    fake::FakeTransferJob job(backend_, record_);
    std::unique_ptr<JobMonitor> monitor;
    ASSERT_EQ(JobMonitor::Create(gate, job, record_->id, 1000, monitor), S_OK);
    MonitorControl control = monitor->GetControl();

    std::thread stopper([&monitor]() { monitor->Stop(); });
    entered.get_future().wait();

    std::atomic<bool> superseded{false};
    std::thread superseder([&control, &superseded]() {
        control.Supersede();
        superseded = true;
    });
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_FALSE(superseded.load());

    release.set_value();
    superseder.join();
    stopper.join();
    EXPECT_TRUE(superseded.load());
    EXPECT_EQ(NormalCount(), 1);
}

TEST_F(JobMonitorTest, UrlReportedOnlyWhenChanged) {
    auto monitor = MakeMonitor(BITSAGENT_MIN_INTERVAL_MS);
    JobStatus status;

    ASSERT_FALSE(monitor->GetStatus(INFINITE, status));
    ASSERT_TRUE(status.url.has_value());
    EXPECT_EQ(*status.url, L"https://example/file");

    ASSERT_FALSE(monitor->GetStatus(INFINITE, status));
    EXPECT_FALSE(status.url.has_value());

    backend_->SetUrl(record_->id, L"https://mirror.example/file");
    ASSERT_FALSE(monitor->GetStatus(INFINITE, status));
    ASSERT_TRUE(status.url.has_value());
    EXPECT_EQ(*status.url, L"https://mirror.example/file");
}

TEST_F(JobMonitorTest, SnapshotReflectsJobState) {
    auto monitor = MakeMonitor(BITSAGENT_MIN_INTERVAL_MS);
    backend_->SetState(record_->id, JobState::Transferred);
    JobStatus status;
    ASSERT_FALSE(monitor->GetStatus(INFINITE, status));
    EXPECT_EQ(status.state, JobState::Transferred);
}

TEST_F(JobMonitorTest, FetchFailureShutsDown) {
    auto monitor = MakeMonitor(1000);
    backend_->With(record_->id, [](fake::FakeJob& j) { j.statusResult = E_OUTOFMEMORY; return 0; });

    JobStatus status;
    MonitorResult result = monitor->GetStatus(INFINITE, status);
    EXPECT_EQ(result.kind, MonitorResultKind::Failed);
    EXPECT_EQ(result.hr, E_OUTOFMEMORY);
    EXPECT_EQ(monitor->GetStatus(INFINITE, status).kind, MonitorResultKind::NotConnected);
}

TEST_F(JobMonitorTest, VanishedJobFailsFetch) {
    auto monitor = MakeMonitor(1000);
    {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        backend_->jobs.clear();
    }
    JobStatus status;
    MonitorResult result = monitor->GetStatus(INFINITE, status);
    EXPECT_EQ(result.kind, MonitorResultKind::Failed);
    EXPECT_EQ(result.hr, BG_E_NOT_FOUND);
}

TEST_F(JobMonitorTest, HandlerFailsOnceMonitorIsGone) {
    auto monitor = MakeMonitor(1000);
    MonitorControl control = monitor->GetControl();
    EXPECT_TRUE(control.IsAlive());

    monitor.reset();
    EXPECT_FALSE(control.IsAlive());
    EXPECT_FALSE(control.SetInterval(100));
    EXPECT_FALSE(control.Stop());
    EXPECT_EQ(backend_->FireTransferred(record_->id), E_FAIL);
}

// ============================================================
// MonitorResultTest
// ============================================================

TEST(MonitorResultTest, DescribeFailureIncludesCode) {
    MonitorResult result = MonitorResult::Make(MonitorResultKind::Failed, E_ACCESSDENIED);
    EXPECT_TRUE(result.IsError());
    EXPECT_NE(result.Describe().find(L"0x80070005"), std::wstring::npos);
}

TEST(MonitorResultTest, OkIsNotError) {
    EXPECT_FALSE(MonitorResult::Ok());
}
