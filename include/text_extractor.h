#pragma once

#include <gumbo.h>

#include <cstddef>
#include <string>
#include <string_view>

// Pages whose visible text is shorter than this are most likely a failed extraction.
constexpr size_t kMinArticleChars = 200;

struct PageText {
    std::string text;
    // <article>, role="article", an article class, og:type=article or a JSON-LD Article/NewsArticle.
    bool article_markup = false;

    bool tooShort() const { return text.size() < kMinArticleChars; }
};

// Readable text of a news page. Navigation, page chrome, forms and non-rendered
// elements are dropped; block elements are separated by a space.
PageText extractPageText(std::string_view html);

bool hasArticleMarkup(const GumboNode* element);
// True if a JSON-LD body declares "@type" as "Article" or "NewsArticle".
bool declaresArticleType(std::string_view json_ld);

// Whitespace runs become one space, ends trimmed.
std::string collapseWhitespace(std::string_view text);
