#pragma once

#include "core/Logging.hpp"
#include <stdexcept>
#include <string>

namespace podarchive {
namespace core {

class FeedFetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct HttpResponse {
    long statusCode = 0;
    std::string body;
    std::string contentType;
    std::string error;  // transport-level failure, empty if the request completed

    bool ok() const { return error.empty() && statusCode >= 200 && statusCode < 300; }
    std::string describe() const;
};

// Performs a blocking GET. Implementations report failures through the
// returned HttpResponse rather than by throwing.
class FetchesBytes {
public:
    virtual ~FetchesBytes() = default;
    virtual HttpResponse get(const std::string& url) = 0;
};

struct HttpClientOptions {
    std::string userAgent = "Mozilla/5.0 (compatible; podarchive/1.0)";
    long timeoutMs = 30000;
    long maxRedirects = 50;
};

class CprHttpClient : public FetchesBytes {
public:
    explicit CprHttpClient(HttpClientOptions options = {}, Logger logger = nullptr);

    HttpResponse get(const std::string& url) override;

private:
    HttpClientOptions options_;
    Logger logger_;
};

// Fetches a feed document, throwing FeedFetchError on any failure.
std::string fetchFeed(FetchesBytes& http, const std::string& url, const Logger& logger);

} // namespace core
} // namespace podarchive
