// TrackDL - String Utilities
// String manipulation and formatting

#pragma once

#include <cstdint>
#include <string>

namespace trackdl::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    static std::string trim(const std::string& str);
    static std::string toLower(const std::string& str);
    static std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);

    static std::string formatBytes(int64_t bytes);

    // Replace anything outside [A-Za-z0-9._-] with '_'; never empty
    static std::string sanitizeFileName(const std::string& name);
};

} // namespace trackdl::utils
