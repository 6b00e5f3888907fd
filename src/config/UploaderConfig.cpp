#include "config/UploaderConfig.hpp"
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace mpupload {

namespace {
    template <typename T>
    T readInteger(const nlohmann::json& j, const char* key, T current,
                  long long minimum, long long maximum) {
        if (!j.contains(key) || j[key].is_null()) {
            return current;
        }
        if (!j[key].is_number_integer()) {
            throw std::invalid_argument(std::string(key) + " must be an integer");
        }
        // Unsigned JSON values past the signed range cannot be narrowed safely
        if (j[key].is_number_unsigned() &&
            j[key].get<uint64_t>() > static_cast<uint64_t>(maximum)) {
            throw std::invalid_argument(std::string(key) + " must be <= " + std::to_string(maximum));
        }
        long long value = j[key].get<long long>();
        if (value < minimum) {
            throw std::invalid_argument(std::string(key) + " must be >= " + std::to_string(minimum));
        }
        if (value > maximum) {
            throw std::invalid_argument(std::string(key) + " must be <= " + std::to_string(maximum));
        }
        return static_cast<T>(value);
    }
}

UploaderConfig UploaderConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Config must be a JSON object");
    }

    UploaderConfig config;

    if (j.contains("backendUrl") && !j["backendUrl"].is_null()) {
        if (!j["backendUrl"].is_string() || j["backendUrl"].get<std::string>().empty()) {
            throw std::invalid_argument("backendUrl must be a non-empty string");
        }
        config.backendUrl = j["backendUrl"].get<std::string>();
    }

    config.chunkSize = readInteger<uint64_t>(j, "chunkSize", config.chunkSize, 1,
                                             std::numeric_limits<long long>::max());
    config.requestTimeoutSeconds = readInteger<long>(
        j, "requestTimeoutSeconds", config.requestTimeoutSeconds, 1, std::numeric_limits<long>::max());
    config.connectTimeoutSeconds = readInteger<long>(
        j, "connectTimeoutSeconds", config.connectTimeoutSeconds, 1, std::numeric_limits<long>::max());
    config.maxPartRetries = readInteger<int>(j, "maxPartRetries", config.maxPartRetries, 0,
                                             MPUPLOAD_MAX_PART_RETRIES);
    config.retryBackoffMs = readInteger<long>(j, "retryBackoffMs", config.retryBackoffMs, 0,
                                              MPUPLOAD_MAX_RETRY_BACKOFF_MS);

    if (j.contains("abortOnFailure") && !j["abortOnFailure"].is_null()) {
        if (!j["abortOnFailure"].is_boolean()) {
            throw std::invalid_argument("abortOnFailure must be a boolean");
        }
        config.abortOnFailure = j["abortOnFailure"].get<bool>();
    }

    return config;
}

UploaderConfig UploaderConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "JSON parse error in " << path << ": " << e.what() << std::endl;
        throw std::runtime_error("Invalid JSON in config file: " + path);
    }

    return fromJson(j);
}

nlohmann::json UploaderConfig::to_json() const {
    return {
        {"backendUrl", backendUrl},
        {"chunkSize", chunkSize},
        {"requestTimeoutSeconds", requestTimeoutSeconds},
        {"connectTimeoutSeconds", connectTimeoutSeconds},
        {"maxPartRetries", maxPartRetries},
        {"retryBackoffMs", retryBackoffMs},
        {"abortOnFailure", abortOnFailure}
    };
}

} // namespace mpupload
