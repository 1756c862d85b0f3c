#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

class IStemmer {
public:
    virtual ~IStemmer() = default;
    virtual std::string stem(const std::string& word) const = 0;
};

struct SuffixRule {
    // Special suffix: the word ends in a double consonant, the replacement is the last letter.
    static constexpr std::string_view kDoubleConsonant = "*d";

    std::string suffix;
    std::string replacement;
    // Receives the word with the suffix removed. Empty means unconditional.
    std::function<bool(const std::string&)> condition;
};

using StemTraceHook = std::function<void(std::string_view step, const std::string& before, const std::string& after)>;

// Porter stemmer in the NLTK_EXTENSIONS flavour: irregular forms pool, words of length <= 2 are
// left alone, and the extended 1a/1b/1c/2 rules.
class PorterStemmer : public IStemmer {
private:
    StemTraceHook trace;

    static std::string applyRuleList(const std::string& word, const std::vector<SuffixRule>& rules);

public:
    PorterStemmer() = default;

    std::string stem(const std::string& word) const override;

    void setTraceHook(StemTraceHook hook) { trace = std::move(hook); }

    static const std::unordered_map<std::string, std::string>& irregularForms();

    static bool isConsonant(const std::string& word, size_t i);
    static int measure(const std::string& stem);
    static bool hasPositiveMeasure(const std::string& stem) { return measure(stem) > 0; }
    static bool containsVowel(const std::string& stem);
    static bool endsDoubleConsonant(const std::string& word);
    static bool endsCVC(const std::string& word);

    std::string step1a(const std::string& word) const;
    std::string step1b(const std::string& word) const;
    std::string step1c(const std::string& word) const;
    std::string step2(const std::string& word) const;
    std::string step3(const std::string& word) const;
    std::string step4(const std::string& word) const;
    std::string step5a(const std::string& word) const;
    std::string step5b(const std::string& word) const;
};

class DummyStemmer : public IStemmer {
public:
    std::string stem(const std::string& word) const override;
    ~DummyStemmer() = default;
};
