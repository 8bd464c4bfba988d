#pragma once
#include <string>

namespace DryDock {
namespace TextUtils {

// Drops bytes that do not form valid UTF-8 sequences.
std::string sanitizeUtf8(const std::string& input);

// Removes markup and decodes the common entities feeds put in descriptions.
std::string stripHtml(const std::string& html);

std::string trim(const std::string& s);

bool startsWith(const std::string& s, const std::string& prefix);

}
}
