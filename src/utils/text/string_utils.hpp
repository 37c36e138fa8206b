#pragma once

#include <string>
#include <vector>

namespace SeoAudit {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        ends_with(const std::string& str, const std::string& suffix);
bool        is_blank(const std::string& str);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Number of code points in a UTF-8 string; stray continuation bytes are not counted.
size_t utf8_length(const std::string& str);

}  // namespace Text
}  // namespace Utils
}  // namespace SeoAudit
