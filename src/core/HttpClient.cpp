#include "core/HttpClient.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <sstream>
#include <utility>
#include <cpr/cpr.h>

namespace podarchive {
namespace core {

std::string HttpResponse::describe() const {
    std::stringstream out;
    if (!error.empty()) {
        out << error;
        if (statusCode != 0) {
            out << " (HTTP " << statusCode << ")";
        }
    } else {
        out << "HTTP " << statusCode;
    }
    return out.str();
}

CprHttpClient::CprHttpClient(HttpClientOptions options, Logger logger)
    : options_(std::move(options)), logger_(logger ? std::move(logger) : makeNullLogger("http")) {
}

HttpResponse CprHttpClient::get(const std::string& url) {
    HttpResponse result;
    if (url.empty()) {
        result.error = "Empty URL provided";
        return result;
    }

    logger_->debug("GET {}", url);
    auto response = cpr::Get(
        cpr::Url{url},
        cpr::Header{
            {"User-Agent", options_.userAgent},
            {"Accept", "*/*"},
            {"Accept-Encoding", "gzip, deflate"}
        },
        cpr::Timeout{std::chrono::milliseconds{options_.timeoutMs}},
        cpr::Redirect{options_.maxRedirects},
        cpr::VerifySsl{true}
    );

    result.statusCode = response.status_code;
    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = response.error.message.empty() ? "transport error" : response.error.message;
        return result;
    }

    auto contentType = response.header.find("content-type");
    if (contentType != response.header.end()) {
        result.contentType = contentType->second;
    }
    result.body = std::move(response.text);
    return result;
}

std::string fetchFeed(FetchesBytes& http, const std::string& url, const Logger& logger) {
    HttpResponse response = http.get(url);
    if (!response.ok()) {
        throw FeedFetchError("Failed to fetch podcast feed: " + response.describe());
    }
    if (response.body.empty()) {
        throw FeedFetchError("Empty response received from feed URL");
    }

    // Validate content type
    if (!response.contentType.empty()) {
        std::string type = response.contentType;
        std::transform(type.begin(), type.end(), type.begin(), ::tolower);
        if (type.find("xml") == std::string::npos &&
            type.find("rss") == std::string::npos &&
            type.find("atom") == std::string::npos) {
            logger->warn("Unexpected feed content type: {}", type);
        }
    }
    return response.body;
}

} // namespace core
} // namespace podarchive
