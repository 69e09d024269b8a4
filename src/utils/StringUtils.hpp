// Tapedeck - String Utilities
// String manipulation and formatting

#pragma once

#include <cstdint>
#include <string>

namespace tapedeck::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    // Search
    static bool contains(const std::string& str, const std::string& substr);
    static bool startsWith(const std::string& str, const std::string& prefix);

    // Formatting
    static std::string formatBytes(uint64_t bytes);
    static std::string formatPercentage(double value, int precision = 1);

    /**
     * @brief Make a single path component out of an arbitrary name.
     * Separators and other unsafe characters become '_'; "." and ".." are never returned.
     */
    static std::string sanitizeFileName(const std::string& name);
};

} // namespace tapedeck::utils
