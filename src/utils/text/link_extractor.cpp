#include "link_extractor.hpp"
#include <gumbo.h>
#include "string_utils.hpp"

namespace Wikipath {
namespace Utils {
namespace Text {

namespace {

void collect_text(const GumboNode* node, std::string& out) {
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE
        || node->type == GUMBO_NODE_CDATA) {
        out += node->v.text.text;
        out += ' ';
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_text(static_cast<const GumboNode*>(children->data[i]), out);
    }
}

void collect_anchors(const GumboNode* node, const std::string& prefix, std::vector<Anchor>& out) {
    if (node->type != GUMBO_NODE_ELEMENT)
        return;

    if (node->v.element.tag == GUMBO_TAG_A) {
        const GumboAttribute* href = gumbo_get_attribute(&node->v.element.attributes, "href");
        if (href && starts_with(href->value, prefix)) {
            std::string text;
            collect_text(node, text);
            out.push_back(Anchor{href->value, collapse_whitespace(text)});
        }
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned int i = 0; i < children->length; ++i) {
        collect_anchors(static_cast<const GumboNode*>(children->data[i]), prefix, out);
    }
}

}  // namespace

std::vector<Anchor> LinkExtractor::extract(const std::string& html, const std::string& prefix) {
    std::vector<Anchor> anchors;
    if (html.empty())
        return anchors;

    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
    collect_anchors(output->root, prefix, anchors);
    gumbo_destroy_output(&kGumboDefaultOptions, output);

    return anchors;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Wikipath
