#include "tokenizer.h"

#include <cctype>
#include <memory>
#include <string>
#include <vector>

#include "stopwords.h"

namespace {

bool isAsciiLetter(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

}  // namespace

Tokenizer::Tokenizer(std::unique_ptr<IStemmer> s) : stemmer(std::move(s)) {}

Tokenizer::Tokenizer() : stemmer(std::make_unique<PorterStemmer>()) {}

std::vector<std::string> Tokenizer::splitWords(std::string_view text) {
    std::vector<std::string> words;
    words.reserve(text.size() / 6);

    std::string current_word;
    current_word.reserve(32);

    for (char c : text) {
        if (isAsciiLetter(c)) {
            current_word += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else if (!current_word.empty()) {
            words.push_back(std::move(current_word));
            current_word.clear();
        }
    }
    if (!current_word.empty()) words.push_back(std::move(current_word));

    return words;
}

std::vector<std::string> Tokenizer::normalize(std::string_view text) const {
    std::vector<std::string> result;
    for (const std::string& word : splitWords(text)) {
        if (isStopword(word)) continue;
        result.push_back(stemmer->stem(word));
    }
    return result;
}

void Tokenizer::tokenize(std::string_view text) {
    tokens.clear();
    total_len = 0;

    std::vector<std::string> words = splitWords(text);
    raw_amount = words.size();
    tokens.reserve(words.size());

    for (const std::string& word : words) {
        if (isStopword(word)) continue;
        std::string stemmed_token = stemmer->stem(word);
        total_len += stemmed_token.size();
        tokens.push_back(std::move(stemmed_token));
    }
}

const std::vector<std::string>& Tokenizer::getTokens() const { return tokens; }

size_t Tokenizer::tokensAmount() const { return tokens.size(); }

size_t Tokenizer::rawTokensAmount() const { return raw_amount; }

size_t Tokenizer::stopwordsRemoved() const { return raw_amount - tokens.size(); }

double Tokenizer::avgTokenLen() const { return tokens.empty() ? 0 : double(total_len) / tokens.size(); }
