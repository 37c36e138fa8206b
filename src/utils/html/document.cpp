#include "document.hpp"
#include <gumbo.h>
#include <memory>
#include <stdexcept>
#include "../text/string_utils.hpp"

namespace SeoAudit {
namespace Utils {
namespace Html {

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const noexcept {
        if (output)
            gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

bool is_element(const GumboNode* node) {
    return node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE;
}

const char* attribute(const GumboNode* node, const char* name) {
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : nullptr;
}

std::string text_content(const GumboNode* node) {
    std::string text;
    std::vector<const GumboNode*> stack{node};
    while (!stack.empty()) {
        const GumboNode* current = stack.back();
        stack.pop_back();

        if (current->type == GUMBO_NODE_TEXT || current->type == GUMBO_NODE_WHITESPACE
            || current->type == GUMBO_NODE_CDATA) {
            text += current->v.text.text;
            continue;
        }
        if (!is_element(current))
            continue;

        const GumboVector& children = current->v.element.children;
        for (unsigned int i = children.length; i > 0; --i)
            stack.push_back(static_cast<const GumboNode*>(children.data[i - 1]));
    }
    return text;
}

int heading_level(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_H1: return 1;
        case GUMBO_TAG_H2: return 2;
        case GUMBO_TAG_H3: return 3;
        case GUMBO_TAG_H4: return 4;
        case GUMBO_TAG_H5: return 5;
        case GUMBO_TAG_H6: return 6;
        default: return 0;
    }
}

void collect(const GumboNode* root, Document& doc) {
    std::vector<const GumboNode*> stack{root};
    while (!stack.empty()) {
        const GumboNode* node = stack.back();
        stack.pop_back();
        if (!is_element(node))
            continue;

        GumboTag tag = node->v.element.tag;
        if (tag == GUMBO_TAG_TITLE && !doc.title) {
            doc.title = text_content(node);
        }
        else if (tag == GUMBO_TAG_META) {
            const char* name = attribute(node, "name");
            if (name) {
                const char* content = attribute(node, "content");
                doc.meta.emplace(Text::to_lower(name), content ? content : "");
            }
        }
        else if (tag == GUMBO_TAG_A) {
            const char* href = attribute(node, "href");
            if (href)
                doc.links.emplace_back(href);
        }
        else if (tag == GUMBO_TAG_IMG) {
            Image       image;
            const char* src = attribute(node, "src");
            const char* alt = attribute(node, "alt");
            image.src       = src ? src : "";
            if (alt)
                image.alt = std::string(alt);
            doc.images.push_back(std::move(image));
        }
        else if (int level = heading_level(tag); level > 0) {
            ++doc.heading_counts[level - 1];
        }

        const GumboVector& children = node->v.element.children;
        for (unsigned int i = children.length; i > 0; --i)
            stack.push_back(static_cast<const GumboNode*>(children.data[i - 1]));
    }
}

}  // namespace

size_t Document::heading_count(int level) const {
    if (level < 1 || level > static_cast<int>(heading_counts.size()))
        return 0;
    return heading_counts[level - 1];
}

std::optional<std::string> Document::meta_content(const std::string& name) const {
    auto it = meta.find(Text::to_lower(name));
    if (it == meta.end())
        return std::nullopt;
    return it->second;
}

Document Document::parse(const std::string& html) {
    Document doc;
    if (html.empty())
        return doc;

    std::unique_ptr<GumboOutput, GumboOutputDeleter> output(
        gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size()));
    if (!output)
        throw std::runtime_error("HTML parser returned no document");

    collect(output->root, doc);
    return doc;
}

}  // namespace Html
}  // namespace Utils
}  // namespace SeoAudit
