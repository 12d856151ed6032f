#pragma once

#include <cstdio>
#include <string>

namespace relief {

    /// Escape a string for embedding inside a JSON string literal
    inline std::string escapeJson(const std::string &str) {
        std::string result;
        result.reserve(str.size());
        for (char c : str) {
            switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
                break;
            }
        }
        return result;
    }

} // namespace relief
