#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "stemmer.h"

class Tokenizer {
private:
    std::vector<std::string> tokens;
    uint64_t total_len{0};
    size_t raw_amount{0};
    std::unique_ptr<IStemmer> stemmer;

public:
    Tokenizer(std::unique_ptr<IStemmer> stemmer);
    Tokenizer();

    // Non-letters become separators, lowercase, split, drop stopwords, stem. Keeps order and duplicates.
    std::vector<std::string> normalize(std::string_view text) const;

    // Only the character cleanup and split, no stopword removal and no stemming.
    static std::vector<std::string> splitWords(std::string_view text);

    virtual void tokenize(std::string_view text);
    virtual ~Tokenizer() = default;

    const std::vector<std::string>& getTokens() const;
    size_t tokensAmount() const;
    size_t rawTokensAmount() const;
    size_t stopwordsRemoved() const;
    double avgTokenLen() const;
    const IStemmer& getStemmer() const { return *stemmer; }
};
