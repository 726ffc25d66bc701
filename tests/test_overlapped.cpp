// BitsAgent Unit Tests - Overlapped I/O engine
// Tests: synchronous and pending completion, timeout cancellation, dropping a pending call

#include <gtest/gtest.h>
#include "common/overlapped.h"
#include "common/named_pipe.h"
#include <cstring>
#include <string>
#include <thread>

using namespace bitsagent;

namespace {

// Raw overlapped pipe pair so the engine is tested below the transport layer
struct RawPipePair {
    SharedHandle server;
    SharedHandle client;
};

bool MakeRawPipePair(RawPipePair& pair) {
    std::wstring name;
    OsError error;
    if (!GenerateRandomPipeName(name, error)) {
        return false;
    }
    std::wstring path = FormatLocalPipePath(name);

    pair.server = MakeSharedHandle(CreateNamedPipeW(
        path.c_str(), PIPE_ACCESS_DUPLEX | FILE_FLAG_OVERLAPPED | FILE_FLAG_FIRST_PIPE_INSTANCE,
        PIPE_TYPE_MESSAGE | PIPE_READMODE_MESSAGE | PIPE_WAIT, 1, 4096, 4096, 0, nullptr));
    if (!pair.server) {
        return false;
    }
    pair.client = MakeSharedHandle(CreateFileW(
        path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr, OPEN_EXISTING,
        FILE_FLAG_OVERLAPPED, nullptr));
    return static_cast<bool>(pair.client);
}

std::unique_ptr<OverlappedContext> MakeContext(const SharedHandle& file) {
    OsError error;
    std::unique_ptr<OverlappedContext> context = OverlappedContext::Create(file, error);
    EXPECT_TRUE(context) << error.code;
    return context;
}

} // namespace

// ============================================================
// EventTest
// ============================================================

TEST(EventTest, WaitTimesOutUntilSignaled) {
    OsError error;
    std::optional<Event> event = Event::Create(error);
    ASSERT_TRUE(event.has_value());

    EXPECT_EQ(event->Wait(10, error), Event::WaitOutcome::TimedOut);
    ASSERT_TRUE(SetEvent(event->Get()));
    EXPECT_EQ(event->Wait(10, error), Event::WaitOutcome::Signaled);
    EXPECT_TRUE(event->Reset());
    EXPECT_EQ(event->Wait(0, error), Event::WaitOutcome::TimedOut);
}

// ============================================================
// OverlappedEngineTest
// ============================================================

class OverlappedEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(MakeRawPipePair(pair_));
        // Collect the connection that CreateFileW already made
        OverlappedFinished finished;
        OsError waitError;
        ASSERT_EQ(CompleteOverlapped(ConnectNamedPipeOverlapped(MakeContext(pair_.server)),
                                     1000, finished, waitError),
                  CompletionStatus::Completed);
        ASSERT_TRUE(finished.Succeeded());
    }

    // Next message on the server end, empty on failure
    std::string ReadMessage() {
        char buffer[64] = {};
        OverlappedFinished read;
        OsError waitError;
        if (CompleteOverlapped(ReadFileOverlapped(MakeContext(pair_.server), buffer, sizeof(buffer)),
                               1000, read, waitError) != CompletionStatus::Completed ||
            !read.Succeeded()) {
            return std::string();
        }
        return std::string(buffer, read.bytesTransferred);
    }

    void WriteMessage(const std::string& message) {
        OverlappedFinished written;
        OsError waitError;
        EXPECT_EQ(CompleteOverlapped(WriteFileOverlapped(MakeContext(pair_.client), message.data(),
                                                         static_cast<DWORD>(message.size())),
                                     1000, written, waitError),
                  CompletionStatus::Completed);
        EXPECT_TRUE(written.Succeeded());
    }

    RawPipePair pair_;
};

TEST_F(OverlappedEngineTest, WriteThenReadDeliversBytes) {
    const char message[] = "status";
    OverlappedFinished written;
    OsError waitError;
    ASSERT_EQ(CompleteOverlapped(WriteFileOverlapped(MakeContext(pair_.client), message, 6),
                                 1000, written, waitError),
              CompletionStatus::Completed);
    ASSERT_TRUE(written.Succeeded());
    EXPECT_EQ(written.bytesTransferred, 6u);
    EXPECT_TRUE(written.context);

    char buffer[16] = {};
    OverlappedFinished read;
    ASSERT_EQ(CompleteOverlapped(ReadFileOverlapped(MakeContext(pair_.server), buffer, sizeof(buffer)),
                                 1000, read, waitError),
              CompletionStatus::Completed);
    ASSERT_TRUE(read.Succeeded());
    EXPECT_EQ(read.bytesTransferred, 6u);
    EXPECT_EQ(std::memcmp(buffer, "status", 6), 0);
}

TEST_F(OverlappedEngineTest, ReadWithoutDataIsPending) {
    char buffer[16];
    OverlappedResult result = ReadFileOverlapped(MakeContext(pair_.server), buffer, sizeof(buffer));
    ASSERT_TRUE(std::holds_alternative<OverlappedPending>(result));

    OverlappedPending& pending = std::get<OverlappedPending>(result);
    EXPECT_TRUE(pending.IsActive());
    EXPECT_FALSE(pending.Finish().has_value());
    EXPECT_TRUE(pending.IsActive());
}

TEST_F(OverlappedEngineTest, PendingCompletesWhenPeerWrites) {
    char buffer[16] = {};
    OverlappedResult result = ReadFileOverlapped(MakeContext(pair_.server), buffer, sizeof(buffer));
    ASSERT_TRUE(std::holds_alternative<OverlappedPending>(result));

    DWORD written = 0;
    OVERLAPPED ov = {};
    ov.hEvent = CreateEventW(nullptr, TRUE, FALSE, nullptr);
    ScopedHandle event = MakeScopedHandle(ov.hEvent);
    if (!WriteFile(pair_.client.get(), "abc", 3, &written, &ov)) {
        ASSERT_EQ(GetLastError(), static_cast<DWORD>(ERROR_IO_PENDING));
        ASSERT_TRUE(GetOverlappedResult(pair_.client.get(), &ov, &written, TRUE));
    }

    OverlappedFinished finished;
    OsError waitError;
    ASSERT_EQ(CompleteOverlapped(std::move(result), 1000, finished, waitError),
              CompletionStatus::Completed);
    EXPECT_TRUE(finished.Succeeded());
    EXPECT_EQ(finished.bytesTransferred, 3u);
}

TEST_F(OverlappedEngineTest, TimeoutCancelsAndReleasesContext) {
    char buffer[16];
    OverlappedFinished finished;
    OsError waitError;
    EXPECT_EQ(CompleteOverlapped(ReadFileOverlapped(MakeContext(pair_.server), buffer, sizeof(buffer)),
                                 50, finished, waitError),
              CompletionStatus::TimedOut);
    EXPECT_FALSE(finished.context);
}

TEST_F(OverlappedEngineTest, DroppedReadDoesNotConsumeLaterMessage) {
    {
        char stale[16];
        OverlappedResult result = ReadFileOverlapped(MakeContext(pair_.server), stale, sizeof(stale));
        ASSERT_TRUE(std::holds_alternative<OverlappedPending>(result));
        // Leaving scope cancels the read and waits for the cancellation
    }

    OverlappedFinished written;
    OsError waitError;
    ASSERT_EQ(CompleteOverlapped(WriteFileOverlapped(MakeContext(pair_.client), "next", 4),
                                 1000, written, waitError),
              CompletionStatus::Completed);

    char buffer[16] = {};
    OverlappedFinished read;
    ASSERT_EQ(CompleteOverlapped(ReadFileOverlapped(MakeContext(pair_.server), buffer, sizeof(buffer)),
                                 1000, read, waitError),
              CompletionStatus::Completed);
    ASSERT_TRUE(read.Succeeded());
    EXPECT_EQ(read.bytesTransferred, 4u);
    EXPECT_EQ(std::memcmp(buffer, "next", 4), 0);
}

TEST_F(OverlappedEngineTest, DroppedReadRacingPeerWrite) {
    const size_t readSize = 16;
    const size_t regionSize = 32;
    for (int i = 0; i < 200; ++i) {
        const std::string racing = "race" + std::to_string(i);
        const std::string marker = "next" + std::to_string(i);

        std::unique_ptr<char[]> region(new char[regionSize]);
        std::memset(region.get(), 0xCD, regionSize);

        std::thread writer([this, &racing]() { WriteMessage(racing); });
        {
            OverlappedResult result = ReadFileOverlapped(MakeContext(pair_.server), region.get(),
                                                         static_cast<DWORD>(readSize));
            // A pending read is cancelled and waited for as result leaves scope
        }
        // The dropped read may have taken the racing message, but it no longer owns the buffer
        std::memset(region.get(), 0xCD, regionSize);
        writer.join();

        WriteMessage(marker);
        std::string first = ReadMessage();
        if (first == racing) {
            EXPECT_EQ(ReadMessage(), marker) << "iteration " << i;
        } else {
            EXPECT_EQ(first, marker) << "iteration " << i;
        }

        for (size_t b = 0; b < regionSize; ++b) {
            ASSERT_EQ(static_cast<unsigned char>(region[b]), 0xCDu) << "iteration " << i << " byte " << b;
        }
        region.reset();
    }
}

TEST_F(OverlappedEngineTest, MovedPendingCancelsOnce) {
    char buffer[16];
    OverlappedResult result = ReadFileOverlapped(MakeContext(pair_.server), buffer, sizeof(buffer));
    ASSERT_TRUE(std::holds_alternative<OverlappedPending>(result));

    OverlappedPending moved = std::move(std::get<OverlappedPending>(result));
    EXPECT_TRUE(moved.IsActive());
    EXPECT_FALSE(std::get<OverlappedPending>(result).IsActive());
}

TEST_F(OverlappedEngineTest, FailureCarriesFunctionAndCode) {
    // Closing the peer breaks the pipe for the next read
    pair_.client.reset();

    char buffer[16];
    OverlappedFinished finished;
    OsError waitError;
    ASSERT_EQ(CompleteOverlapped(ReadFileOverlapped(MakeContext(pair_.server), buffer, sizeof(buffer)),
                                 1000, finished, waitError),
              CompletionStatus::Completed);
    EXPECT_FALSE(finished.Succeeded());
    EXPECT_EQ(finished.error.code, static_cast<DWORD>(ERROR_BROKEN_PIPE));
    EXPECT_STREQ(finished.error.function, L"ReadFile");
    EXPECT_NE(finished.error.Describe().find(L"ReadFile failed (109)"), std::wstring::npos);
}

// ============================================================
// FormatSystemMessageTest
// ============================================================

TEST(FormatSystemMessageTest, KnownCodeHasTextWithoutNewline) {
    std::wstring text = FormatSystemMessage(ERROR_ACCESS_DENIED);
    EXPECT_FALSE(text.empty());
    EXPECT_EQ(text.find(L'\n'), std::wstring::npos);
}
