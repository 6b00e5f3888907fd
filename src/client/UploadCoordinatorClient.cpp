#include "client/UploadCoordinatorClient.hpp"
#include "http/FormEncoding.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace mpupload {

namespace {
    // Extracts a required string field from a 200 response body
    std::string requireString(const nlohmann::json& body, const char* field) {
        if (!body.is_object() || !body.contains(field) || !body[field].is_string()) {
            throw std::runtime_error(std::string("missing string field '") + field + "'");
        }
        std::string value = body[field].get<std::string>();
        if (value.empty()) {
            throw std::runtime_error(std::string("empty field '") + field + "'");
        }
        return value;
    }
}

UploadCoordinatorClient::UploadCoordinatorClient(http::HttpTransport& transport,
                                                 const std::string& baseUrl)
    : transport_(transport), baseUrl_(baseUrl) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') {
        baseUrl_.pop_back();
    }
}

http::Response UploadCoordinatorClient::postForm(
    const std::string& path,
    const std::vector<std::pair<std::string, std::string>>& fields,
    CoordinatorStage stage, int partNumber) {

    http::Request request;
    request.method = HttpMethod::POST;
    request.url = baseUrl_ + path;
    request.setHeader("Content-Type", "application/x-www-form-urlencoded");
    request.body = http::formEncode(fields);

    http::Response response;
    try {
        response = transport_.perform(request);
    } catch (const TransportError& e) {
        throw CoordinatorError(stage, 0, e.what(), partNumber);
    }

    if (!response.ok()) {
        std::cerr << "Coordinator " << to_string(stage) << " HTTP error " << response.status
                  << ": " << response.body << std::endl;
        throw CoordinatorError(stage, response.status, response.body, partNumber);
    }
    return response;
}

http::Response UploadCoordinatorClient::postJson(const std::string& path, const std::string& body,
                                                 CoordinatorStage stage) {
    http::Request request;
    request.method = HttpMethod::POST;
    request.url = baseUrl_ + path;
    request.setHeader("Content-Type", "application/json");
    request.body = body;

    http::Response response;
    try {
        response = transport_.perform(request);
    } catch (const TransportError& e) {
        throw CoordinatorError(stage, 0, e.what());
    }

    if (!response.ok()) {
        std::cerr << "Coordinator " << to_string(stage) << " HTTP error " << response.status
                  << ": " << response.body << std::endl;
        throw CoordinatorError(stage, response.status, response.body);
    }
    return response;
}

InitiateResult UploadCoordinatorClient::initiate(const std::string& filename,
                                                 const std::string& contentType) {
    http::Response response = postForm("/upload/initiate",
                                       {{"filename", filename}, {"content_type", contentType}},
                                       CoordinatorStage::Initiate);

    try {
        nlohmann::json jsonResponse = nlohmann::json::parse(response.body);
        InitiateResult result;
        result.uploadId = requireString(jsonResponse, "uploadId");
        result.key = requireString(jsonResponse, "key");
        return result;
    } catch (const std::exception& e) {
        std::cerr << "Malformed initiate response (" << e.what() << "): " << response.body
                  << std::endl;
        throw CoordinatorError(CoordinatorStage::Initiate, response.status, response.body);
    }
}

std::string UploadCoordinatorClient::getPartUploadUrl(const std::string& key,
                                                      const std::string& uploadId,
                                                      int partNumber) {
    http::Response response = postForm("/upload/presigned-url",
                                       {{"key", key},
                                        {"uploadId", uploadId},
                                        {"partNumber", std::to_string(partNumber)}},
                                       CoordinatorStage::Presign, partNumber);

    try {
        nlohmann::json jsonResponse = nlohmann::json::parse(response.body);
        return requireString(jsonResponse, "url");
    } catch (const std::exception& e) {
        std::cerr << "Malformed presigned-url response for part " << partNumber << " ("
                  << e.what() << "): " << response.body << std::endl;
        throw CoordinatorError(CoordinatorStage::Presign, response.status, response.body,
                               partNumber);
    }
}

void UploadCoordinatorClient::complete(const std::string& key, const std::string& uploadId,
                                       const std::vector<PartResult>& parts) {
    nlohmann::json requestBody = {
        {"key", key},
        {"uploadId", uploadId},
        {"parts", nlohmann::json::array()}
    };

    for (const auto& part : parts) {
        requestBody["parts"].push_back({
            {"PartNumber", part.partNumber},
            {"ETag", part.partIdentifier}
        });
    }

    postJson("/upload/complete", requestBody.dump(), CoordinatorStage::Complete);
}

void UploadCoordinatorClient::abort(const std::string& key, const std::string& uploadId) {
    nlohmann::json requestBody = {
        {"key", key},
        {"uploadId", uploadId}
    };

    postJson("/upload/abort", requestBody.dump(), CoordinatorStage::Abort);
}

} // namespace mpupload
