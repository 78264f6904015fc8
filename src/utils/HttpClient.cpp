/**
 * HttpClient.cpp
 *
 * HTTP client implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"

#include <cpr/cpr.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace trackdl::utils {

namespace {

void copyResponse(const cpr::Response& response, HttpResponse& result) {
    result.statusCode = static_cast<int>(response.status_code);

    if (response.error.code != cpr::ErrorCode::OK) {
        result.error = response.error.message.empty()
            ? "transfer failed"
            : response.error.message;
    }
}

} // namespace

std::string HttpResponse::describeFailure() const {
    if (!error.empty()) {
        return error;
    }
    return "HTTP " + std::to_string(statusCode);
}

HttpClient::HttpClient(HttpOptions options)
    : m_options(std::move(options)) {}

HttpResponse HttpClient::downloadFile(const std::string& url, const std::string& destination) const {
    HttpResponse result;

    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        result.error = "cannot open " + destination + " for writing";
        return result;
    }

    cpr::Response response = cpr::Download(
        file,
        cpr::Url{url},
        cpr::Timeout{m_options.timeoutSeconds * 1000},
        cpr::ConnectTimeout{m_options.connectTimeoutSeconds * 1000},
        cpr::VerifySsl{m_options.verifySSL},
        cpr::UserAgent{m_options.userAgent}
    );

    file.close();
    copyResponse(response, result);

    if (result.error.empty() && file.fail()) {
        result.error = "write to " + destination + " failed";
    }

    if (!result.isSuccess()) {
        std::error_code ec;
        std::filesystem::remove(destination, ec);
    }

    return result;
}

std::string HttpClient::urlEncode(const std::string& str) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << static_cast<int>(c);
        }
    }

    return escaped.str();
}

} // namespace trackdl::utils
