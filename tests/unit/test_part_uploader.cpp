#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "uplift/transfer/part_uploader.hpp"
#include "support/upload_fixtures.hpp"

using namespace uplift;
using namespace uplift::test;
using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgReferee;
using core::UploadError;
using core::UploadResult;

class MockStorageClient : public transfer::StorageClient {
public:
    MOCK_METHOD(UploadResult, initiate, (const transfer::SourceMetadata&, transfer::RemoteUpload&), (override));
    MOCK_METHOD(UploadResult, presign_part, (const transfer::RemoteUpload&, uint32_t, transfer::PresignedPart&), (override));
    MOCK_METHOD(UploadResult, upload_bytes,
                (const transfer::PresignedPart&, std::span<const uint8_t>, std::chrono::milliseconds,
                 const std::atomic<bool>&, std::string&), (override));
    MOCK_METHOD(UploadResult, complete, (const transfer::RemoteUpload&, const std::vector<transfer::CompletedPart>&), (override));
    MOCK_METHOD(UploadResult, abort, (const transfer::RemoteUpload&), (override));
};

class PartUploaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        source = dir / "clip.bin";
        write_pattern_file(source, 10 * KB);
        session = make_session(source, 4 * KB, parts);
        session.remote_upload_id = "upload-1";
        session.remote_path = "uploads/clip.bin";

        target.url = "https://storage.test/uploads/clip.bin?partNumber=2";
    }

    TempDir dir;
    std::filesystem::path source;
    storage::UploadSession session;
    std::vector<storage::UploadPart> parts;
    transfer::PresignedPart target;
    ::testing::StrictMock<MockStorageClient> client;
    transfer::PartUploader uploader{client, std::chrono::milliseconds(5000)};
    std::atomic<bool> cancelled{false};
};

TEST_F(PartUploaderTest, UploadsPartRange) {
    EXPECT_CALL(client, presign_part(_, 2, _))
        .WillOnce(DoAll(SetArgReferee<2>(target), Return(UploadResult())));
    EXPECT_CALL(client, upload_bytes(_, _, std::chrono::milliseconds(5000), _, _))
        .WillOnce([](const transfer::PresignedPart& presigned, std::span<const uint8_t> bytes,
                     std::chrono::milliseconds, const std::atomic<bool>&, std::string& token) {
            EXPECT_NE(presigned.url.find("partNumber=2"), std::string::npos);
            EXPECT_EQ(bytes.size(), 4 * KB);
            EXPECT_EQ(bytes[0], static_cast<uint8_t>((4 * KB * 31 + 7) % 251));
            token = "\"etag-2\"";
            return UploadResult();
        });

    transfer::PartReceipt receipt;
    auto result = uploader.upload(session, parts[1], cancelled, receipt);

    ASSERT_TRUE(result) << result.message;
    EXPECT_EQ(receipt.integrity_token, "\"etag-2\"");
    EXPECT_EQ(receipt.bytes_sent, 4 * KB);
    EXPECT_EQ(receipt.content_digest.size(), 64);
}

TEST_F(PartUploaderTest, LastPartIsShort) {
    EXPECT_CALL(client, presign_part(_, 3, _)).WillOnce(Return(UploadResult()));
    EXPECT_CALL(client, upload_bytes(_, _, _, _, _))
        .WillOnce([](const transfer::PresignedPart&, std::span<const uint8_t> bytes,
                     std::chrono::milliseconds, const std::atomic<bool>&, std::string& token) {
            EXPECT_EQ(bytes.size(), 2 * KB);
            token = "t3";
            return UploadResult();
        });

    transfer::PartReceipt receipt;
    ASSERT_TRUE(uploader.upload(session, parts[2], cancelled, receipt));
    EXPECT_EQ(receipt.bytes_sent, 2 * KB);
}

TEST_F(PartUploaderTest, CancelledBeforeStart) {
    cancelled = true;

    transfer::PartReceipt receipt;
    EXPECT_EQ(uploader.upload(session, parts[0], cancelled, receipt).error, UploadError::CANCELLED);
}

TEST_F(PartUploaderTest, RequiresRemoteUpload) {
    session.remote_upload_id.clear();

    transfer::PartReceipt receipt;
    EXPECT_EQ(uploader.upload(session, parts[0], cancelled, receipt).error, UploadError::INVALID_STATE);
}

TEST_F(PartUploaderTest, SourceChanged) {
    write_pattern_file(source, 12 * KB);

    transfer::PartReceipt receipt;
    EXPECT_EQ(uploader.upload(session, parts[0], cancelled, receipt).error, UploadError::SOURCE_READ);
}

TEST_F(PartUploaderTest, PresignFailurePropagates) {
    EXPECT_CALL(client, presign_part(_, 1, _))
        .WillOnce(Return(UploadResult(UploadError::TRANSIENT_NETWORK, "503 from presign")));

    transfer::PartReceipt receipt;
    auto result = uploader.upload(session, parts[0], cancelled, receipt);
    EXPECT_EQ(result.error, UploadError::TRANSIENT_NETWORK);
    EXPECT_TRUE(result.is_retryable());
}

TEST_F(PartUploaderTest, DigestMismatchWithPreviousAttempt) {
    parts[0].content_digest = std::string(64, '0');
    EXPECT_CALL(client, presign_part(_, 1, _)).WillOnce(Return(UploadResult()));

    transfer::PartReceipt receipt;
    auto result = uploader.upload(session, parts[0], cancelled, receipt);
    EXPECT_EQ(result.error, UploadError::SOURCE_READ);
    EXPECT_FALSE(result.is_retryable());
}

TEST_F(PartUploaderTest, MatchingDigestIsAccepted) {
    EXPECT_CALL(client, presign_part(_, 1, _)).WillRepeatedly(Return(UploadResult()));
    EXPECT_CALL(client, upload_bytes(_, _, _, _, _))
        .WillRepeatedly(DoAll(SetArgReferee<4>(std::string("t1")), Return(UploadResult())));

    transfer::PartReceipt first;
    ASSERT_TRUE(uploader.upload(session, parts[0], cancelled, first));

    parts[0].content_digest = first.content_digest;
    transfer::PartReceipt second;
    ASSERT_TRUE(uploader.upload(session, parts[0], cancelled, second));
    EXPECT_EQ(second.content_digest, first.content_digest);
}

TEST_F(PartUploaderTest, EmptyTokenIsRejected) {
    EXPECT_CALL(client, presign_part(_, 1, _)).WillOnce(Return(UploadResult()));
    EXPECT_CALL(client, upload_bytes(_, _, _, _, _)).WillOnce(Return(UploadResult()));

    transfer::PartReceipt receipt;
    EXPECT_EQ(uploader.upload(session, parts[0], cancelled, receipt).error, UploadError::PERMANENT_REJECTION);
}

TEST_F(PartUploaderTest, UploadFailurePropagates) {
    EXPECT_CALL(client, presign_part(_, 1, _)).WillOnce(Return(UploadResult()));
    EXPECT_CALL(client, upload_bytes(_, _, _, _, _))
        .WillOnce(Return(UploadResult(UploadError::PERMANENT_REJECTION, "403 Forbidden")));

    transfer::PartReceipt receipt;
    EXPECT_EQ(uploader.upload(session, parts[0], cancelled, receipt).error, UploadError::PERMANENT_REJECTION);
}
