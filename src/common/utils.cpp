#include "crelay/common/utils.h"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace crelay {

namespace {

// Base64解码表，非法字符为0xFF
const unsigned char* base64DecodeTable() {
    static unsigned char table[256];
    static bool initialized = [] {
        std::fill(std::begin(table), std::end(table), 0xFF);
        const char* alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (int i = 0; i < 64; ++i) {
            table[static_cast<unsigned char>(alphabet[i])] = static_cast<unsigned char>(i);
        }
        return true;
    }();
    (void)initialized;
    return table;
}

} // namespace

std::string formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1fs", static_cast<double>(ms) / 1000.0);
        return buf;
    } else {
        auto minutes = ms / 60000;
        auto seconds = (ms % 60000) / 1000;
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }
}

std::string trimString(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) {
        return "";
    }
    
    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string toLowerCopy(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool base64Decode(const std::string& encoded, std::string& decoded) {
    const unsigned char* table = base64DecodeTable();
    
    decoded.clear();
    decoded.reserve(encoded.size() / 4 * 3);
    
    unsigned int buffer = 0;
    int bits = 0;
    size_t padding = 0;
    size_t symbols = 0;
    
    for (char ch : encoded) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            continue;
        }
        if (c == '=') {
            ++padding;
            ++symbols;
            continue;
        }
        // '='之后不允许再出现数据字符
        if (padding > 0) {
            return false;
        }
        unsigned char value = table[c];
        if (value == 0xFF) {
            return false;
        }
        buffer = (buffer << 6) | value;
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<char>((buffer >> bits) & 0xFF));
        }
    }
    
    if (padding > 2 || symbols % 4 != 0) {
        return false;
    }
    return true;
}

std::string urlEncodePathSegment(const std::string& segment) {
    static const char* hex = "0123456789ABCDEF";
    std::string result;
    result.reserve(segment.size() * 3);
    for (char ch : segment) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            result.push_back(ch);
        } else {
            result.push_back('%');
            result.push_back(hex[c >> 4]);
            result.push_back(hex[c & 0x0F]);
        }
    }
    return result;
}

std::string truncateForLog(const std::string& str, size_t maxLength) {
    if (str.size() <= maxLength) {
        return str;
    }
    return str.substr(0, maxLength) + "...";
}

}  // namespace crelay
