// BitsAgent Unit Tests - Named pipe transport
// Tests: naming, message boundaries, timeouts, failure disconnects, inbound pipes

#include <gtest/gtest.h>
#include "common/named_pipe.h"
#include "common/types.h"
#include <cstring>

using namespace bitsagent;

// ============================================================
// PipeNameTest
// ============================================================

TEST(PipeNameTest, GeneratedNamesAreValidAndDistinct) {
    std::wstring first;
    std::wstring second;
    OsError error;
    ASSERT_TRUE(GenerateRandomPipeName(first, error));
    ASSERT_TRUE(GenerateRandomPipeName(second, error));

    EXPECT_EQ(first.size(), PIPE_ID_HEX_DIGITS);
    EXPECT_TRUE(IsValidPipeName(first));
    EXPECT_NE(first, second);
}

TEST(PipeNameTest, LocalPathFormat) {
    EXPECT_EQ(FormatLocalPipePath(L"abc"), L"\\\\.\\pipe\\abc");
}

// ============================================================
// NamedPipeTest
// ============================================================

class NamedPipeTest : public ::testing::Test {
protected:
    // Server plus a connected duplex client
    void Connect(PipeDirection direction = PipeDirection::Duplex) {
        OsError error;
        server_ = PipeServer::Create(direction, PipeAccess::Default, error);
        ASSERT_TRUE(server_) << error.code;

        client_ = (direction == PipeDirection::Duplex)
            ? PipeClient::OpenDuplex(server_->GetName(), error)
            : PipeClient::OpenOutbound(server_->GetName(), error);
        ASSERT_TRUE(client_) << error.code;

        ASSERT_FALSE(server_->Connect(1000));
        ASSERT_TRUE(server_->IsConnected());
    }

    std::unique_ptr<PipeServer> server_;
    std::unique_ptr<PipeClient> client_;
};

TEST_F(NamedPipeTest, ConnectTimesOutWithoutClient) {
    OsError error;
    server_ = PipeServer::Create(PipeDirection::Duplex, PipeAccess::Default, error);
    ASSERT_TRUE(server_);

    PipeError err = server_->Connect(50);
    EXPECT_EQ(err.kind, PipeErrorKind::Timeout);
    EXPECT_FALSE(server_->IsConnected());
}

TEST_F(NamedPipeTest, EachWriteIsOneRead) {
    Connect();

    const std::vector<std::vector<uint8_t>> messages = {
        {1}, {2, 3, 4}, std::vector<uint8_t>(1000, 0x5A)
    };
    for (const auto& m : messages) {
        ASSERT_FALSE(client_->WriteMessage(m, 1000));
    }
    for (const auto& m : messages) {
        std::vector<uint8_t> received;
        ASSERT_FALSE(server_->ReadMessage(received, 4096, 1000));
        EXPECT_EQ(received, m);
    }
}

TEST_F(NamedPipeTest, ServerToClient) {
    Connect();
    ASSERT_FALSE(server_->Write("reply", 5, 1000));

    char buffer[16] = {};
    DWORD bytesRead = 0;
    ASSERT_FALSE(client_->Read(buffer, sizeof(buffer), 1000, bytesRead));
    EXPECT_EQ(bytesRead, 5u);
    EXPECT_EQ(std::memcmp(buffer, "reply", 5), 0);
}

TEST_F(NamedPipeTest, SmallBufferFailsWithMoreDataAndDisconnects) {
    Connect();
    ASSERT_FALSE(client_->WriteMessage(std::vector<uint8_t>(64, 1), 1000));

    std::vector<uint8_t> received;
    PipeError err = server_->ReadMessage(received, 16, 1000);
    EXPECT_EQ(err.kind, PipeErrorKind::Api);
    EXPECT_EQ(err.os.code, static_cast<DWORD>(ERROR_MORE_DATA));
    EXPECT_TRUE(received.empty());
    EXPECT_FALSE(server_->IsConnected());

    EXPECT_EQ(server_->ReadMessage(received, 4096, 1000).kind, PipeErrorKind::NotConnected);
}

TEST_F(NamedPipeTest, ReadTimeoutDisconnects) {
    Connect();

    char buffer[16];
    DWORD bytesRead = 0;
    EXPECT_EQ(client_->Read(buffer, sizeof(buffer), 50, bytesRead).kind, PipeErrorKind::Timeout);
    EXPECT_FALSE(client_->IsConnected());
    EXPECT_EQ(client_->Read(buffer, sizeof(buffer), 50, bytesRead).kind, PipeErrorKind::NotConnected);
    EXPECT_EQ(client_->Write("x", 1, 50).kind, PipeErrorKind::NotConnected);
}

TEST_F(NamedPipeTest, PeerCloseIsBrokenPipe) {
    Connect();
    client_.reset();

    char buffer[16];
    DWORD bytesRead = 0;
    PipeError err = server_->Read(buffer, sizeof(buffer), 1000, bytesRead);
    EXPECT_EQ(err.kind, PipeErrorKind::Api);
    EXPECT_EQ(err.os.code, static_cast<DWORD>(ERROR_BROKEN_PIPE));
    EXPECT_FALSE(server_->IsConnected());
}

TEST_F(NamedPipeTest, DataWrittenBeforeCloseIsStillDelivered) {
    Connect();
    ASSERT_FALSE(client_->Write("last", 4, 1000));
    client_.reset();

    char buffer[16] = {};
    DWORD bytesRead = 0;
    ASSERT_FALSE(server_->Read(buffer, sizeof(buffer), 1000, bytesRead));
    EXPECT_EQ(bytesRead, 4u);
}

TEST_F(NamedPipeTest, ServerDisconnectAllowsNewClient) {
    Connect();
    server_->Disconnect();
    EXPECT_FALSE(server_->IsConnected());
    client_.reset();

    OsError error;
    client_ = PipeClient::OpenDuplex(server_->GetName(), error);
    ASSERT_TRUE(client_) << error.code;
    ASSERT_FALSE(server_->Connect(1000));
    ASSERT_FALSE(client_->Write("again", 5, 1000));

    char buffer[16];
    DWORD bytesRead = 0;
    ASSERT_FALSE(server_->Read(buffer, sizeof(buffer), 1000, bytesRead));
    EXPECT_EQ(bytesRead, 5u);
}

TEST_F(NamedPipeTest, InboundServerWithOutboundClient) {
    Connect(PipeDirection::Inbound);
    ASSERT_FALSE(client_->Write("one-way", 7, 1000));

    char buffer[16] = {};
    DWORD bytesRead = 0;
    ASSERT_FALSE(server_->Read(buffer, sizeof(buffer), 1000, bytesRead));
    EXPECT_EQ(bytesRead, 7u);
    EXPECT_EQ(std::memcmp(buffer, "one-way", 7), 0);
}

TEST_F(NamedPipeTest, InboundServerCannotWrite) {
    Connect(PipeDirection::Inbound);
    EXPECT_TRUE(server_->Write("x", 1, 1000));
}

TEST(PipeClientTest, MissingPipeFailsToOpen) {
    std::wstring name;
    OsError error;
    ASSERT_TRUE(GenerateRandomPipeName(name, error));

    std::unique_ptr<PipeClient> client = PipeClient::OpenDuplex(name, error);
    EXPECT_FALSE(client);
    EXPECT_STREQ(error.function, L"CreateFileW");
    EXPECT_EQ(error.code, static_cast<DWORD>(ERROR_FILE_NOT_FOUND));
}

TEST(PipeServerTest, LocalServiceAccessCreates) {
    OsError error;
    auto duplex = PipeServer::Create(PipeDirection::Duplex, PipeAccess::LocalService, error);
    EXPECT_TRUE(duplex) << error.code;
    auto inbound = PipeServer::Create(PipeDirection::Inbound, PipeAccess::LocalService, error);
    EXPECT_TRUE(inbound) << error.code;
}

// ============================================================
// PipeErrorTest
// ============================================================

TEST(PipeErrorTest, Describe) {
    EXPECT_EQ(PipeError::Ok().Describe(), L"ok");
    EXPECT_FALSE(PipeError::Ok());
    EXPECT_TRUE(PipeError::Timeout());
    EXPECT_EQ(PipeError::WriteCount(10, 4).Describe(), L"short write: 4 of 10 bytes");
    EXPECT_NE(PipeError::Api(OsError(L"WriteFile", ERROR_NO_DATA)).Describe().find(L"WriteFile failed (232)"),
              std::wstring::npos);
}
