// TrackDL - HTTP Client
// Blocking HTTP helpers on top of cpr

#pragma once

#include <string>

namespace trackdl::utils {

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
    int statusCode{0};
    std::string error;

    bool isSuccess() const {
        return error.empty() && statusCode >= 200 && statusCode < 300;
    }

    /**
     * Transport error if any, otherwise "HTTP <code>"
     */
    std::string describeFailure() const;
};

/**
 * @brief HTTP client options, fixed per client
 */
struct HttpOptions {
    int timeoutSeconds{30};
    int connectTimeoutSeconds{10};
    bool verifySSL{true};
    std::string userAgent{"TrackDL/1.0"};
};

/**
 * @brief Blocking HTTP client
 *
 * Safe to share between download workers; every call builds its own
 * session.
 */
class HttpClient {
public:
    explicit HttpClient(HttpOptions options);

    /**
     * Stream the body of a GET into a file. The file is removed again
     * if the request fails.
     */
    HttpResponse downloadFile(const std::string& url, const std::string& destination) const;

    // URL utilities
    static std::string urlEncode(const std::string& str);

private:
    HttpOptions m_options;
};

} // namespace trackdl::utils
