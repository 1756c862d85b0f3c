#include "text_extractor.h"

#include <cctype>
#include <memory>
#include <utility>
#include <vector>

namespace {

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

std::string_view attribute(const GumboNode* element, const char* name) {
    const GumboAttribute* attr = gumbo_get_attribute(&element->v.element.attributes, name);
    return attr ? std::string_view(attr->value) : std::string_view();
}

bool hasClass(std::string_view classes, std::string_view wanted) {
    size_t pos = 0;
    while (pos < classes.size()) {
        while (pos < classes.size() && std::isspace(static_cast<unsigned char>(classes[pos]))) ++pos;
        size_t end = pos;
        while (end < classes.size() && !std::isspace(static_cast<unsigned char>(classes[end]))) ++end;
        if (classes.substr(pos, end - pos) == wanted) return true;
        pos = end;
    }
    return false;
}

// Subtrees that never hold article prose.
bool isPageChrome(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_HEAD:
        case GUMBO_TAG_TITLE:
        case GUMBO_TAG_SCRIPT:
        case GUMBO_TAG_STYLE:
        case GUMBO_TAG_NOSCRIPT:
        case GUMBO_TAG_IFRAME:
        case GUMBO_TAG_NAV:
        case GUMBO_TAG_HEADER:
        case GUMBO_TAG_FOOTER:
        case GUMBO_TAG_ASIDE:
        case GUMBO_TAG_BUTTON:
        case GUMBO_TAG_FORM:
        case GUMBO_TAG_INPUT:
        case GUMBO_TAG_SELECT:
        case GUMBO_TAG_TEXTAREA:
            return true;
        default:
            return false;
    }
}

bool breaksWords(GumboTag tag) {
    switch (tag) {
        case GUMBO_TAG_P:
        case GUMBO_TAG_DIV:
        case GUMBO_TAG_BR:
        case GUMBO_TAG_HR:
        case GUMBO_TAG_H1:
        case GUMBO_TAG_H2:
        case GUMBO_TAG_H3:
        case GUMBO_TAG_H4:
        case GUMBO_TAG_H5:
        case GUMBO_TAG_H6:
        case GUMBO_TAG_UL:
        case GUMBO_TAG_OL:
        case GUMBO_TAG_LI:
        case GUMBO_TAG_DL:
        case GUMBO_TAG_DT:
        case GUMBO_TAG_DD:
        case GUMBO_TAG_TABLE:
        case GUMBO_TAG_TR:
        case GUMBO_TAG_TD:
        case GUMBO_TAG_TH:
        case GUMBO_TAG_MAIN:
        case GUMBO_TAG_ARTICLE:
        case GUMBO_TAG_SECTION:
        case GUMBO_TAG_BLOCKQUOTE:
        case GUMBO_TAG_FIGURE:
        case GUMBO_TAG_FIGCAPTION:
        case GUMBO_TAG_PRE:
            return true;
        default:
            return false;
    }
}

bool isJsonLd(const GumboNode* element) {
    return element->v.element.tag == GUMBO_TAG_SCRIPT &&
           equalsIgnoreCase(attribute(element, "type"), "application/ld+json");
}

std::string_view scriptBody(const GumboNode* script) {
    const GumboVector& children = script->v.element.children;
    if (children.length == 0) return {};
    const auto* child = static_cast<const GumboNode*>(children.data[0]);
    if (child->type != GUMBO_NODE_TEXT && child->type != GUMBO_NODE_CDATA) return {};
    return child->v.text.text;
}

}  // namespace

bool hasArticleMarkup(const GumboNode* element) {
    if (element->type != GUMBO_NODE_ELEMENT) return false;

    GumboTag tag = element->v.element.tag;
    if (tag == GUMBO_TAG_ARTICLE) return true;
    if (equalsIgnoreCase(attribute(element, "role"), "article")) return true;

    std::string_view classes = attribute(element, "class");
    if (hasClass(classes, "article") || hasClass(classes, "post-content") || hasClass(classes, "entry-content")) {
        return true;
    }

    if (tag == GUMBO_TAG_META) {
        return attribute(element, "property") == "og:type" && attribute(element, "content") == "article";
    }
    if (isJsonLd(element)) return declaresArticleType(scriptBody(element));
    return false;
}

bool declaresArticleType(std::string_view json_ld) {
    constexpr std::string_view kKey = "\"@type\"";

    auto skipSpaces = [&](size_t pos) {
        while (pos < json_ld.size() && std::isspace(static_cast<unsigned char>(json_ld[pos]))) ++pos;
        return pos;
    };

    for (size_t key = json_ld.find(kKey); key != std::string_view::npos; key = json_ld.find(kKey, key + 1)) {
        size_t pos = skipSpaces(key + kKey.size());
        if (pos >= json_ld.size() || json_ld[pos] != ':') continue;
        pos = skipSpaces(pos + 1);
        if (pos >= json_ld.size() || json_ld[pos] != '"') continue;

        size_t close = json_ld.find('"', pos + 1);
        if (close == std::string_view::npos) return false;
        std::string_view type = json_ld.substr(pos + 1, close - pos - 1);
        if (type == "Article" || type == "NewsArticle") return true;
    }
    return false;
}

std::string collapseWhitespace(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    bool gap = false;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            gap = !out.empty();
            continue;
        }
        if (gap) out += ' ';
        gap = false;
        out += ch;
    }
    return out;
}

PageText extractPageText(std::string_view html) {
    std::unique_ptr<GumboOutput, void (*)(GumboOutput*)> output(
        gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.length()),
        [](GumboOutput* out) { gumbo_destroy_output(&kGumboDefaultOptions, out); });

    PageText page;
    std::string raw;

    // nullptr entries mark the end of a word-breaking element.
    std::vector<std::pair<const GumboNode*, bool>> pending;
    pending.emplace_back(output->root, true);

    while (!pending.empty()) {
        auto [node, visible] = pending.back();
        pending.pop_back();

        if (!node) {
            raw += ' ';
            continue;
        }

        switch (node->type) {
            case GUMBO_NODE_TEXT:
            case GUMBO_NODE_CDATA:
            case GUMBO_NODE_WHITESPACE:
                if (visible) raw += node->v.text.text;
                break;
            case GUMBO_NODE_ELEMENT: {
                if (!page.article_markup && hasArticleMarkup(node)) page.article_markup = true;

                GumboTag tag = node->v.element.tag;
                bool shown = visible && !isPageChrome(tag);
                if (shown && breaksWords(tag)) {
                    raw += ' ';
                    pending.emplace_back(nullptr, true);
                }

                const GumboVector& children = node->v.element.children;
                for (unsigned int i = children.length; i > 0; --i) {
                    pending.emplace_back(static_cast<const GumboNode*>(children.data[i - 1]), shown);
                }
                break;
            }
            default:
                // <template> contents and comments are never rendered.
                break;
        }
    }

    page.text = collapseWhitespace(raw);
    return page;
}
