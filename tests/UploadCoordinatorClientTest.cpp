#include <gtest/gtest.h>
#include "client/UploadCoordinatorClient.hpp"
#include "support/FakeTransport.hpp"

namespace mpupload {
namespace test {

class UploadCoordinatorClientTest : public ::testing::Test {
protected:
    FakeTransport transport_;
    UploadCoordinatorClient client_{transport_, FakeTransport::kBaseUrl};
};

TEST_F(UploadCoordinatorClientTest, InitiatePostsFormAndParsesIds) {
    InitiateResult result = client_.initiate("my photo.jpg", "image/jpeg");

    EXPECT_EQ(result.uploadId, "upload-1");
    EXPECT_EQ(result.key, "uploads/1_my photo.jpg");

    const http::Request& sent = transport_.last("initiate");
    EXPECT_EQ(sent.method, HttpMethod::POST);
    EXPECT_EQ(sent.body, "filename=my%20photo.jpg&content_type=image%2Fjpeg");
    ASSERT_EQ(sent.headers.size(), 1u);
    EXPECT_EQ(sent.headers[0].second, "application/x-www-form-urlencoded");
}

TEST_F(UploadCoordinatorClientTest, TrailingSlashInBaseUrlIsIgnored) {
    UploadCoordinatorClient client(transport_, std::string(FakeTransport::kBaseUrl) + "/");

    client.initiate("a.png", "image/png");

    EXPECT_EQ(transport_.routes().back(), "initiate");
}

TEST_F(UploadCoordinatorClientTest, InitiateNon200KeepsBody) {
    transport_.on("initiate", [](const http::Request&) {
        return makeResponse(400, R"({"detail":"bad filename"})");
    });

    try {
        client_.initiate("a.png", "image/png");
        FAIL() << "expected CoordinatorError";
    } catch (const CoordinatorError& e) {
        EXPECT_EQ(e.stage(), CoordinatorStage::Initiate);
        EXPECT_EQ(e.httpStatus(), 400);
        EXPECT_EQ(e.body(), R"({"detail":"bad filename"})");
    }
}

TEST_F(UploadCoordinatorClientTest, InitiateWithMalformedBodyFails) {
    transport_.on("initiate", [](const http::Request&) {
        return makeResponse(200, R"({"uploadId":"u"})");
    });
    EXPECT_THROW(client_.initiate("a.png", "image/png"), CoordinatorError);

    transport_.on("initiate", [](const http::Request&) { return makeResponse(200, "not json"); });
    EXPECT_THROW(client_.initiate("a.png", "image/png"), CoordinatorError);
}

TEST_F(UploadCoordinatorClientTest, PresignSendsPartNumberAsString) {
    std::string url = client_.getPartUploadUrl("uploads/k", "u-1", 7);

    EXPECT_EQ(url, std::string(FakeTransport::kStorageUrl) + "7");
    auto form = parseForm(transport_.last("presign:7").body);
    EXPECT_EQ(form["key"], "uploads/k");
    EXPECT_EQ(form["uploadId"], "u-1");
    EXPECT_EQ(form["partNumber"], "7");
}

TEST_F(UploadCoordinatorClientTest, PresignFailureCarriesPartNumber) {
    transport_.on("presign:2", [](const http::Request&) {
        return makeResponse(500, "Internal Server Error");
    });

    try {
        client_.getPartUploadUrl("k", "u", 2);
        FAIL() << "expected CoordinatorError";
    } catch (const CoordinatorError& e) {
        EXPECT_EQ(e.stage(), CoordinatorStage::Presign);
        EXPECT_EQ(e.partNumber(), 2);
        EXPECT_EQ(e.httpStatus(), 500);
    }
}

TEST_F(UploadCoordinatorClientTest, CompleteSendsPartsAsJson) {
    client_.complete("uploads/k", "u-1", {{1, "\"e1\""}, {2, "\"e2\""}});

    const http::Request& sent = transport_.last("complete");
    EXPECT_EQ(sent.headers[0].second, "application/json");

    nlohmann::json body = nlohmann::json::parse(sent.body);
    EXPECT_EQ(body["key"], "uploads/k");
    EXPECT_EQ(body["uploadId"], "u-1");
    ASSERT_EQ(body["parts"].size(), 2u);
    EXPECT_EQ(body["parts"][0]["PartNumber"], 1);
    EXPECT_EQ(body["parts"][0]["ETag"], "\"e1\"");
    EXPECT_EQ(body["parts"][1]["PartNumber"], 2);
    EXPECT_TRUE(body["parts"][1]["PartNumber"].is_number_integer());
}

TEST_F(UploadCoordinatorClientTest, CompleteNon200Throws) {
    transport_.on("complete", [](const http::Request&) {
        return makeResponse(400, "InvalidPart");
    });

    try {
        client_.complete("k", "u", {{1, "e"}});
        FAIL() << "expected CoordinatorError";
    } catch (const CoordinatorError& e) {
        EXPECT_EQ(e.stage(), CoordinatorStage::Complete);
        EXPECT_EQ(e.body(), "InvalidPart");
    }
}

TEST_F(UploadCoordinatorClientTest, TransportFailureBecomesCoordinatorError) {
    transport_.on("initiate", [](const http::Request&) -> http::Response {
        throw TransportError("CURL error: Couldn't connect to server");
    });

    try {
        client_.initiate("a.png", "image/png");
        FAIL() << "expected CoordinatorError";
    } catch (const CoordinatorError& e) {
        EXPECT_EQ(e.httpStatus(), 0);
        EXPECT_NE(e.body().find("Couldn't connect"), std::string::npos);
    }
}

TEST_F(UploadCoordinatorClientTest, AbortPostsKeyAndUploadId) {
    client_.abort("uploads/k", "u-9");

    nlohmann::json body = nlohmann::json::parse(transport_.last("abort").body);
    EXPECT_EQ(body["key"], "uploads/k");
    EXPECT_EQ(body["uploadId"], "u-9");
}

} // namespace test
} // namespace mpupload
