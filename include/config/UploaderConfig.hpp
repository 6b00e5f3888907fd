#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "config.hpp"

namespace mpupload {

struct UploaderConfig {
    std::string backendUrl = MPUPLOAD_BACKEND_URL;
    uint64_t chunkSize = MPUPLOAD_CHUNK_SIZE;
    long requestTimeoutSeconds = MPUPLOAD_REQUEST_TIMEOUT_SECONDS;
    long connectTimeoutSeconds = MPUPLOAD_CONNECT_TIMEOUT_SECONDS;
    int maxPartRetries = 0;                          // transport failures only, <= MPUPLOAD_MAX_PART_RETRIES
    long retryBackoffMs = MPUPLOAD_RETRY_BACKOFF_MS; // doubles per attempt up to MPUPLOAD_MAX_RETRY_BACKOFF_MS
    bool abortOnFailure = false;

    // Keys absent from the object keep their defaults.
    // @throws std::invalid_argument on a wrong type or out-of-range value
    static UploaderConfig fromJson(const nlohmann::json& j);

    // @throws std::runtime_error if the file cannot be read or parsed
    static UploaderConfig loadFromFile(const std::string& path);

    nlohmann::json to_json() const;
};

} // namespace mpupload
