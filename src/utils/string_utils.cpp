/**
 * @file string_utils.cpp
 * @brief Implementation of engine string helpers
 * 
 * @date 2025
 */

#include "runcage/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace runcage {
namespace utils {

namespace {

constexpr const char* kReplacementChar = "\xEF\xBF\xBD";

// Length of the well-formed UTF-8 sequence starting at data[i], or 0.
std::size_t ValidSequenceLength(const std::string& data, std::size_t i) {
    const auto byte = [&](std::size_t k) {
        return static_cast<unsigned char>(data[k]);
    };
    const auto is_cont = [&](std::size_t k) {
        return k < data.size() && (byte(k) & 0xC0) == 0x80;
    };

    unsigned char lead = byte(i);
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return is_cont(i + 1) ? 2 : 0;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        if (!is_cont(i + 1) || !is_cont(i + 2)) return 0;
        unsigned char second = byte(i + 1);
        if (lead == 0xE0 && second < 0xA0) return 0;  // overlong
        if (lead == 0xED && second > 0x9F) return 0;  // surrogate
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        if (!is_cont(i + 1) || !is_cont(i + 2) || !is_cont(i + 3)) return 0;
        unsigned char second = byte(i + 1);
        if (lead == 0xF0 && second < 0x90) return 0;  // overlong
        if (lead == 0xF4 && second > 0x8F) return 0;  // > U+10FFFF
        return 4;
    }
    return 0;
}

} // anonymous namespace

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

std::string StringUtils::SanitizeUtf8(const std::string& bytes) {
    std::string result;
    result.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        std::size_t len = ValidSequenceLength(bytes, i);
        if (len == 0) {
            result += kReplacementChar;
            ++i;
            continue;
        }
        result.append(bytes, i, len);
        i += len;
    }

    return result;
}

std::string StringUtils::ShortId(const std::string& container_id) {
    return container_id.substr(0, 12);
}

std::string StringUtils::FormatCommandLine(const std::vector<std::string>& argv) {
    std::vector<std::string> quoted;
    quoted.reserve(argv.size());

    for (const auto& arg : argv) {
        bool needs_quotes = arg.empty() || std::any_of(arg.begin(), arg.end(), [](unsigned char c) {
            return std::isspace(c) || c == '\'' || c == '"' || c == '$';
        });
        if (!needs_quotes) {
            quoted.push_back(arg);
            continue;
        }
        std::string q = "'";
        for (char c : arg) {
            if (c == '\'') q += "'\\''";
            else q += c;
        }
        q += "'";
        quoted.push_back(q);
    }

    return Join(quoted, " ");
}

} // namespace utils
} // namespace runcage
