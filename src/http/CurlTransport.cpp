#include "http/CurlTransport.hpp"
#include "upload/UploadErrors.hpp"
#include <curl/curl.h>
#include <iostream>

namespace mpupload {
namespace http {

namespace {
    size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
        size_t totalSize = size * nmemb;
        userp->append(static_cast<char*>(contents), totalSize);
        return totalSize;
    }

    void trim(std::string& s) {
        size_t start = 0;
        size_t end = s.size();
        while (start < end && (s[start] == ' ' || s[start] == '\t')) ++start;
        while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t' ||
                                s[end - 1] == '\r' || s[end - 1] == '\n')) --end;
        s = s.substr(start, end - start);
    }

    // Called once per header line, status line included
    size_t headerCallback(char* buffer, size_t size, size_t nitems,
                          std::vector<std::pair<std::string, std::string>>* headers) {
        size_t totalSize = size * nitems;
        std::string line(buffer, totalSize);

        // A new status line starts a new response (e.g. after 100 Continue)
        if (line.rfind("HTTP/", 0) == 0) {
            headers->clear();
            return totalSize;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            return totalSize;
        }

        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        trim(name);
        trim(value);
        if (!name.empty()) {
            headers->emplace_back(name, value);
        }
        return totalSize;
    }
}

CurlTransport::CurlTransport(long timeoutSeconds, long connectTimeoutSeconds)
    : timeoutSeconds_(timeoutSeconds), connectTimeoutSeconds_(connectTimeoutSeconds) {}

Response CurlTransport::perform(const Request& request) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransportError("Failed to initialize CURL");
    }

    Response response;
    struct curl_slist* headerList = nullptr;

    for (const auto& header : request.headers) {
        // libcurl derives Content-Length from the body itself
        if (equalsIgnoreCase(header.first, "Content-Length")) continue;
        std::string line = header.first + ": " + header.second;
        headerList = curl_slist_append(headerList, line.c_str());
    }
    // Large bodies would otherwise wait for 100-continue
    headerList = curl_slist_append(headerList, "Expect:");

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            break;
        case HttpMethod::PUT:
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            break;
    }

    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, connectTimeoutSeconds_);

    CURLcode res = curl_easy_perform(curl);

    long httpCode = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);

    curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        std::cerr << "CURL error on " << to_string(request.method) << " " << request.url
                  << ": " << curl_easy_strerror(res) << std::endl;
        throw TransportError(std::string("CURL error: ") + curl_easy_strerror(res));
    }

    response.status = httpCode;
    return response;
}

} // namespace http
} // namespace mpupload
