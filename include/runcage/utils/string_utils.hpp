/**
 * @file string_utils.hpp
 * @brief String helpers shared by the engine and its container backends
 * 
 * Case folding and trimming for language lookup, splitting and joining for
 * command lines, UTF-8 repair for captured program output, and short id
 * formatting for logs.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace runcage {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 * 
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /// Strip leading and trailing whitespace
    static std::string Trim(const std::string& str);

    /// ASCII lowercase copy
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param str Input string
     * @param delimiter Separator character
     * @return Tokens, empty tokens skipped
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     * @param strings Parts to join
     * @param delimiter Separator placed between parts
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);

    /**
     * @brief Repair invalid UTF-8
     * 
     * Every byte that does not belong to a well-formed UTF-8 sequence is
     * replaced by U+FFFD. Valid input is returned unchanged. Overlong forms,
     * surrogates and code points above U+10FFFF count as invalid.
     * 
     * @param bytes Raw bytes captured from a container stream
     * @return Valid UTF-8 string
     */
    static std::string SanitizeUtf8(const std::string& bytes);

    /// First 12 characters of a container id, as docker prints them
    static std::string ShortId(const std::string& container_id);

    /**
     * @brief Quote an argv for debug logging
     * 
     * Arguments containing whitespace or quotes are wrapped in single quotes.
     * Output is for humans only; commands are never run through a shell.
     */
    static std::string FormatCommandLine(const std::vector<std::string>& argv);
};

} // namespace utils
} // namespace runcage
