#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

#include "string_hash.h"

using StopwordSet = std::unordered_set<std::string, StringHash, std::equal_to<>>;

// English stopword list (NLTK). Lookups are exact and expect lowercase input.
const StopwordSet& stopwords();

bool isStopword(std::string_view word);

size_t stopwordsAmount();
