#include "utils/TextUtils.hpp"
#include <regex>

namespace DryDock {
namespace TextUtils {

std::string sanitizeUtf8(const std::string& input) {
    std::string result;
    result.reserve(input.size());
    const char* p = input.c_str();
    while (*p) {
        unsigned char c = static_cast<unsigned char>(*p);
        if (c < 0x80) {
            result += *p;
            p++;
        } else if ((c & 0xE0) == 0xC0 && p[1]) {
            if ((p[1] & 0xC0) == 0x80) {
                result.append(p, 2);
                p += 2;
            } else {
                p++;
            }
        } else if ((c & 0xF0) == 0xE0 && p[1] && p[2]) {
            if ((p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80) {
                result.append(p, 3);
                p += 3;
            } else {
                p++;
            }
        } else if ((c & 0xF8) == 0xF0 && p[1] && p[2] && p[3]) {
            if ((p[1] & 0xC0) == 0x80 && (p[2] & 0xC0) == 0x80 && (p[3] & 0xC0) == 0x80) {
                result.append(p, 4);
                p += 4;
            } else {
                p++;
            }
        } else {
            p++; // Skip invalid byte
        }
    }
    return result;
}

static void replaceAll(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string stripHtml(const std::string& html) {
    static const std::regex tagRegex("<[^>]*>");
    std::string desc = std::regex_replace(html, tagRegex, "");
    replaceAll(desc, "&lt;", "<");
    replaceAll(desc, "&gt;", ">");
    replaceAll(desc, "&quot;", "\"");
    replaceAll(desc, "&nbsp;", " ");
    replaceAll(desc, "&#39;", "'");
    replaceAll(desc, "&apos;", "'");
    // Last so "&amp;lt;" stays literal
    replaceAll(desc, "&amp;", "&");
    return trim(desc);
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    size_t end = s.find_last_not_of(" \t\n\r");
    return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

}
}
