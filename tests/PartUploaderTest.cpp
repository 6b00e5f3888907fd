#include <gtest/gtest.h>
#include "client/PartUploader.hpp"
#include "support/FakeTransport.hpp"

namespace mpupload {
namespace test {

class PartUploaderTest : public ::testing::Test {
protected:
    FakeTransport transport_;
    PartUploader uploader_{transport_};
    const std::string url_ = std::string(FakeTransport::kStorageUrl) + "1";

    PartUploadError expectFailure() {
        try {
            uploader_.putPart(url_, "bytes");
        } catch (const PartUploadError& e) {
            return e;
        }
        ADD_FAILURE() << "expected PartUploadError";
        return PartUploadError(PartFailure::Transport, "none");
    }
};

TEST_F(PartUploaderTest, PutsRawBytesWithLengthAndType) {
    std::string bytes("\x00\x01\xFFpayload", 10);

    std::string etag = uploader_.putPart(url_, bytes);

    EXPECT_EQ(etag, "\"etag-1\"");
    const http::Request& sent = transport_.last("put:1");
    EXPECT_EQ(sent.method, HttpMethod::PUT);
    EXPECT_EQ(sent.body, bytes);
    ASSERT_EQ(sent.headers.size(), 2u);
    EXPECT_EQ(sent.headers[0], std::make_pair(std::string("Content-Length"), std::string("10")));
    EXPECT_EQ(sent.headers[1], std::make_pair(std::string("Content-Type"),
                                              std::string("application/octet-stream")));
}

TEST_F(PartUploaderTest, EtagHeaderLookupIgnoresCase) {
    transport_.on("put:1", [](const http::Request&) {
        return makeResponse(200, "", {{"x-amz-request-id", "r"}, {"etag", "\"lower\""}});
    });

    EXPECT_EQ(uploader_.putPart(url_, "x"), "\"lower\"");
}

TEST_F(PartUploaderTest, MissingEtagIsProtocolFailure) {
    transport_.on("put:1", [](const http::Request&) { return makeResponse(200); });

    PartUploadError e = expectFailure();
    EXPECT_EQ(e.reason(), PartFailure::MissingIdentifier);
    EXPECT_EQ(e.httpStatus(), 200);
}

TEST_F(PartUploaderTest, EmptyEtagIsProtocolFailure) {
    transport_.on("put:1", [](const http::Request&) {
        return makeResponse(200, "", {{"ETag", ""}});
    });

    EXPECT_EQ(expectFailure().reason(), PartFailure::MissingIdentifier);
}

TEST_F(PartUploaderTest, OnlyStatus200IsSuccess) {
    for (long status : {201L, 204L, 302L, 403L, 500L}) {
        transport_.on("put:1", [status](const http::Request&) {
            return makeResponse(status, "", {{"ETag", "\"would-be\""}});
        });

        PartUploadError e = expectFailure();
        EXPECT_EQ(e.reason(), PartFailure::NonSuccessStatus) << "status " << status;
        EXPECT_EQ(e.httpStatus(), status);
    }
}

TEST_F(PartUploaderTest, TransportExceptionIsWrapped) {
    transport_.on("put:1", [](const http::Request&) -> http::Response {
        throw TransportError("CURL error: Timeout was reached");
    });

    PartUploadError e = expectFailure();
    EXPECT_EQ(e.reason(), PartFailure::Transport);
    EXPECT_EQ(e.cause(), "CURL error: Timeout was reached");
    EXPECT_EQ(transport_.count("put:1"), 1u);
}

} // namespace test
} // namespace mpupload
