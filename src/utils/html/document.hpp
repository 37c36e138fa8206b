#pragma once
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace SeoAudit {
namespace Utils {
namespace Html {

struct Image {
    std::string                src;
    std::optional<std::string> alt;
};

// The parts of an HTML page the on-page checks look at, in document order.
struct Document {
    std::optional<std::string>         title;
    std::map<std::string, std::string> meta;  // lower-cased name -> content of first occurrence
    std::array<size_t, 6>              heading_counts{};
    std::vector<std::string>           links;
    std::vector<Image>                 images;

    size_t                     heading_count(int level) const;
    std::optional<std::string> meta_content(const std::string& name) const;

    static Document parse(const std::string& html);
};

}  // namespace Html
}  // namespace Utils
}  // namespace SeoAudit
