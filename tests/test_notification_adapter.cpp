// BitsAgent Unit Tests - Notification adapter
// Tests: reference counting, interface queries, handler dispatch and fault boundary

#include <gtest/gtest.h>
#include "service/notification_adapter.h"
#include "common/logger.h"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace bitsagent;
using Microsoft::WRL::ComPtr;

namespace {

// The adapter is destroyed once the token's only other owner (the handler) is gone
JobNotificationHandlers TokenHandlers(const std::shared_ptr<int>& token) {
    JobNotificationHandlers handlers;
    handlers.transferred = [token]() { return S_OK; };
    return handlers;
}

} // namespace

// ============================================================
// NotificationAdapterRefCountTest
// ============================================================

TEST(NotificationAdapterRefCountTest, BalancedAddRefReleaseKeepsObject) {
    auto token = std::make_shared<int>(0);
    ComPtr<NotificationAdapter> adapter = NotificationAdapter::Create(TokenHandlers(token));
    ASSERT_TRUE(adapter);

    const ULONG n = 5;
    for (ULONG i = 0; i < n; ++i) {
        EXPECT_EQ(adapter->AddRef(), i + 2);
    }
    for (ULONG i = 0; i < n; ++i) {
        EXPECT_EQ(adapter->Release(), n - i);
    }
    EXPECT_EQ(token.use_count(), 2);

    adapter.Reset();
    EXPECT_EQ(token.use_count(), 1);
}

TEST(NotificationAdapterRefCountTest, ExtraReleaseDestroys) {
    auto token = std::make_shared<int>(0);
    NotificationAdapter* raw = NotificationAdapter::Create(TokenHandlers(token)).Detach();
    ASSERT_NE(raw, nullptr);

    const ULONG n = 3;
    for (ULONG i = 0; i < n; ++i) {
        raw->AddRef();
    }
    for (ULONG i = 0; i < n; ++i) {
        raw->Release();
    }
    EXPECT_EQ(token.use_count(), 2);
    EXPECT_EQ(raw->Release(), 0u);
    EXPECT_EQ(token.use_count(), 1);
}

TEST(NotificationAdapterRefCountTest, ServiceReferenceOutlivesCreator) {
    auto token = std::make_shared<int>(0);
    IBackgroundCopyCallback* held = nullptr;
    {
        ComPtr<NotificationAdapter> adapter = NotificationAdapter::Create(TokenHandlers(token));
        held = adapter.Get();
        held->AddRef();
    }
    EXPECT_EQ(token.use_count(), 2);
    EXPECT_EQ(held->JobTransferred(nullptr), S_OK);
    held->Release();
    EXPECT_EQ(token.use_count(), 1);
}

TEST(NotificationAdapterRefCountTest, ConcurrentReferencesAndEvents) {
    auto token = std::make_shared<int>(0);
    std::atomic<int> transferred{0};
    JobNotificationHandlers handlers;
    handlers.transferred = [token, &transferred]() { ++transferred; return S_OK; };
    NotificationAdapter* raw = NotificationAdapter::Create(handlers).Detach();
    handlers = JobNotificationHandlers();
    ASSERT_NE(raw, nullptr);

    const int threadCount = 8;
    const int rounds = 2000;
    std::vector<std::thread> threads;
    for (int t = 0; t < threadCount; ++t) {
        threads.emplace_back([raw]() {
            for (int i = 0; i < rounds; ++i) {
                raw->AddRef();
                raw->JobTransferred(nullptr);
                raw->Release();
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(transferred.load(), threadCount * rounds);
    EXPECT_EQ(token.use_count(), 2);
    EXPECT_EQ(raw->Release(), 0u);
    EXPECT_EQ(token.use_count(), 1);
}

// ============================================================
// NotificationAdapterQueryTest
// ============================================================

TEST(NotificationAdapterQueryTest, SupportedInterfaces) {
    ComPtr<NotificationAdapter> adapter = NotificationAdapter::Create(JobNotificationHandlers());

    ComPtr<IBackgroundCopyCallback> callback;
    EXPECT_EQ(adapter.As(&callback), S_OK);
    EXPECT_TRUE(callback);

    ComPtr<IUnknown> unknown;
    EXPECT_EQ(adapter.As(&unknown), S_OK);
    EXPECT_TRUE(unknown);
}

TEST(NotificationAdapterQueryTest, UnsupportedInterface) {
    ComPtr<NotificationAdapter> adapter = NotificationAdapter::Create(JobNotificationHandlers());
    void* object = reinterpret_cast<void*>(1);
    EXPECT_EQ(adapter->QueryInterface(__uuidof(IDispatch), &object), E_NOINTERFACE);
    EXPECT_EQ(object, nullptr);
}

TEST(NotificationAdapterQueryTest, NullOutPointer) {
    ComPtr<NotificationAdapter> adapter = NotificationAdapter::Create(JobNotificationHandlers());
    EXPECT_EQ(adapter->QueryInterface(__uuidof(IUnknown), nullptr), E_POINTER);
}

// ============================================================
// NotificationAdapterDispatchTest
// ============================================================

TEST(NotificationAdapterDispatchTest, EventsReachTheirHandlers) {
    int transferred = 0;
    int errors = 0;
    JobNotificationHandlers handlers;
    handlers.transferred = [&transferred]() { ++transferred; return S_OK; };
    handlers.error = [&errors]() { ++errors; return S_FALSE; };
    ComPtr<NotificationAdapter> adapter = NotificationAdapter::Create(handlers);

    EXPECT_EQ(adapter->JobTransferred(nullptr), S_OK);
    EXPECT_EQ(adapter->JobError(nullptr, nullptr), S_FALSE);
    EXPECT_EQ(transferred, 1);
    EXPECT_EQ(errors, 1);
}

TEST(NotificationAdapterDispatchTest, MissingHandlerIsOk) {
    ComPtr<NotificationAdapter> adapter = NotificationAdapter::Create(JobNotificationHandlers());
    EXPECT_EQ(adapter->JobTransferred(nullptr), S_OK);
    EXPECT_EQ(adapter->JobError(nullptr, nullptr), S_OK);
    EXPECT_EQ(adapter->JobModification(nullptr, 0), S_OK);
}

TEST(NotificationAdapterDispatchTest, ThrowingHandlerBecomesFailure) {
    JobNotificationHandlers handlers;
    handlers.transferred = []() -> HRESULT { throw std::runtime_error("boom"); };
    handlers.error = []() -> HRESULT { throw 42; };
    ComPtr<NotificationAdapter> adapter = NotificationAdapter::Create(handlers);

    EXPECT_EQ(adapter->JobTransferred(nullptr), E_FAIL);
    EXPECT_EQ(adapter->JobError(nullptr, nullptr), E_FAIL);
}

TEST(NotificationAdapterDispatchTest, ExceptionTextLoggedAsUtf8) {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path();
    const std::wstring fileName = L"bitsagent_notify_test_" + std::to_wstring(GetCurrentProcessId()) + L".log";
    const fs::path logFile = dir / fileName;

    LightweightLogger& logger = LightweightLogger::Instance();
    logger.Shutdown();
    ASSERT_TRUE(logger.Initialize(dir.wstring(), fileName));

    JobNotificationHandlers handlers;
    handlers.transferred = []() -> HRESULT { throw std::runtime_error("\xC3\xA9" "chec"); };
    ComPtr<NotificationAdapter> adapter = NotificationAdapter::Create(handlers);
    EXPECT_EQ(adapter->JobTransferred(nullptr), E_FAIL);
    logger.Shutdown();

    std::ifstream in(logFile, std::ios::binary);
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    in.close();
    std::error_code ec;
    fs::remove(logFile, ec);

    EXPECT_NE(contents.find("handler failed - \xC3\xA9" "chec"), std::string::npos);
}

TEST(NotificationAdapterDispatchTest, HandlerResultPassedThrough) {
    JobNotificationHandlers handlers;
    handlers.modification = []() { return E_ACCESSDENIED; };
    ComPtr<NotificationAdapter> adapter = NotificationAdapter::Create(handlers);
    EXPECT_EQ(adapter->JobModification(nullptr, 0), E_ACCESSDENIED);
}

// ============================================================
// NotifyFlagsTest
// ============================================================

TEST(NotifyFlagsTest, OnlyPresentHandlers) {
    JobNotificationHandlers handlers;
    EXPECT_EQ(NotificationAdapter::NotifyFlagsFor(handlers), 0u);

    handlers.transferred = []() { return S_OK; };
    handlers.error = []() { return S_OK; };
    EXPECT_EQ(NotificationAdapter::NotifyFlagsFor(handlers),
              static_cast<DWORD>(BG_NOTIFY_JOB_TRANSFERRED | BG_NOTIFY_JOB_ERROR));

    handlers.modification = []() { return S_OK; };
    EXPECT_EQ(NotificationAdapter::NotifyFlagsFor(handlers),
              static_cast<DWORD>(BG_NOTIFY_JOB_TRANSFERRED | BG_NOTIFY_JOB_ERROR |
                                 BG_NOTIFY_JOB_MODIFICATION));
}
