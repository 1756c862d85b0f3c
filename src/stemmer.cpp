#include "stemmer.h"

#include <cctype>
#include <string>
#include <utility>
#include <vector>

namespace {

bool endsWith(const std::string& w, std::string_view suffix) {
    if (w.size() < suffix.size()) return false;
    return w.compare(w.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string dropSuffix(const std::string& w, size_t suffix_len) { return w.substr(0, w.size() - suffix_len); }

bool isVowelChar(char c) { return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u'; }

bool positiveMeasure(const std::string& stem) { return PorterStemmer::hasPositiveMeasure(stem); }

bool measureAboveOne(const std::string& stem) { return PorterStemmer::measure(stem) > 1; }

}  // namespace

const std::unordered_map<std::string, std::string>& PorterStemmer::irregularForms() {
    // stem -> surface forms, reported to Martin Porter as errors over the years
    static const std::unordered_map<std::string, std::string> pool = [] {
        const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
            {"sky", {"sky", "skies"}},
            {"die", {"dying"}},
            {"lie", {"lying"}},
            {"tie", {"tying"}},
            {"news", {"news"}},
            {"inning", {"innings", "inning"}},
            {"outing", {"outings", "outing"}},
            {"canning", {"cannings", "canning"}},
            {"howe", {"howe"}},
            {"proceed", {"proceed"}},
            {"exceed", {"exceed"}},
            {"succeed", {"succeed"}},
        };

        std::unordered_map<std::string, std::string> inverted;
        for (const auto& [stem, forms] : table) {
            for (const auto& form : forms) {
                inverted.emplace(form, stem);
            }
        }
        return inverted;
    }();
    return pool;
}

bool PorterStemmer::isConsonant(const std::string& word, size_t i) {
    char c = word[i];
    if (isVowelChar(c)) return false;
    if (c == 'y') {
        if (i == 0) return true;
        return !isConsonant(word, i - 1);
    }
    return true;
}

int PorterStemmer::measure(const std::string& stem) {
    std::string cv_sequence;
    cv_sequence.reserve(stem.size());
    for (size_t i = 0; i < stem.size(); ++i) {
        cv_sequence += isConsonant(stem, i) ? 'c' : 'v';
    }

    int count = 0;
    size_t pos = cv_sequence.find("vc");
    while (pos != std::string::npos) {
        ++count;
        pos = cv_sequence.find("vc", pos + 1);
    }
    return count;
}

bool PorterStemmer::containsVowel(const std::string& stem) {
    for (size_t i = 0; i < stem.size(); ++i) {
        if (!isConsonant(stem, i)) return true;
    }
    return false;
}

bool PorterStemmer::endsDoubleConsonant(const std::string& word) {
    size_t n = word.size();
    return n >= 2 && word[n - 1] == word[n - 2] && isConsonant(word, n - 1);
}

bool PorterStemmer::endsCVC(const std::string& word) {
    size_t n = word.size();
    if (n >= 3) {
        char last = word[n - 1];
        return isConsonant(word, n - 3) && !isConsonant(word, n - 2) && isConsonant(word, n - 1) && last != 'w' &&
               last != 'x' && last != 'y';
    }
    // NLTK extension for two letter stems: "vc" counts as *o
    return n == 2 && !isConsonant(word, 0) && isConsonant(word, 1);
}

std::string PorterStemmer::applyRuleList(const std::string& word, const std::vector<SuffixRule>& rules) {
    for (const auto& rule : rules) {
        if (rule.suffix == SuffixRule::kDoubleConsonant) {
            if (endsDoubleConsonant(word)) {
                std::string stem = dropSuffix(word, 2);
                if (!rule.condition || rule.condition(stem)) {
                    return stem + rule.replacement;
                }
                return word;
            }
            continue;
        }

        if (endsWith(word, rule.suffix)) {
            std::string stem = dropSuffix(word, rule.suffix.size());
            if (!rule.condition || rule.condition(stem)) {
                return stem + rule.replacement;
            }
            return word;
        }
    }
    return word;
}

std::string PorterStemmer::step1a(const std::string& word) const {
    // flies -> fli, but dies -> die
    if (word.size() == 4 && endsWith(word, "ies")) {
        return dropSuffix(word, 3) + "ie";
    }

    static const std::vector<SuffixRule> rules = {
        {"sses", "ss", nullptr},
        {"ies", "i", nullptr},
        {"ss", "ss", nullptr},
        {"s", "", nullptr},
    };
    return applyRuleList(word, rules);
}

std::string PorterStemmer::step1b(const std::string& word) const {
    if (endsWith(word, "ied")) {
        return dropSuffix(word, 3) + (word.size() == 4 ? "ie" : "i");
    }

    if (endsWith(word, "eed")) {
        std::string stem = dropSuffix(word, 3);
        if (measure(stem) > 0) return stem + "ee";
        return word;
    }

    std::string intermediate;
    bool stripped = false;
    for (std::string_view suffix : {std::string_view("ed"), std::string_view("ing")}) {
        if (endsWith(word, suffix)) {
            std::string stem = dropSuffix(word, suffix.size());
            if (containsVowel(stem)) {
                intermediate = std::move(stem);
                stripped = true;
                break;
            }
        }
    }

    if (!stripped) return word;

    const char last = intermediate.back();
    const std::vector<SuffixRule> cleanup = {
        {"at", "ate", nullptr},
        {"bl", "ble", nullptr},
        {"iz", "ize", nullptr},
        {std::string(SuffixRule::kDoubleConsonant), std::string(1, last),
         [last](const std::string&) { return last != 'l' && last != 's' && last != 'z'; }},
        {"", "e", [](const std::string& stem) { return measure(stem) == 1 && endsCVC(stem); }},
    };
    return applyRuleList(intermediate, cleanup);
}

std::string PorterStemmer::step1c(const std::string& word) const {
    static const std::vector<SuffixRule> rules = {
        {"y", "i", [](const std::string& stem) { return stem.size() > 1 && isConsonant(stem, stem.size() - 1); }},
    };
    return applyRuleList(word, rules);
}

std::string PorterStemmer::step2(const std::string& word) const {
    // ALLI -> AL is tried before the table so that the result can go through the table again
    if (endsWith(word, "alli") && hasPositiveMeasure(dropSuffix(word, 4))) {
        return step2(dropSuffix(word, 4) + "al");
    }

    static const std::vector<SuffixRule> rules = {
        {"ational", "ate", positiveMeasure},
        {"tional", "tion", positiveMeasure},
        {"enci", "ence", positiveMeasure},
        {"anci", "ance", positiveMeasure},
        {"izer", "ize", positiveMeasure},
        {"bli", "ble", positiveMeasure},
        {"alli", "al", positiveMeasure},
        {"entli", "ent", positiveMeasure},
        {"eli", "e", positiveMeasure},
        {"ousli", "ous", positiveMeasure},
        {"ization", "ize", positiveMeasure},
        {"ation", "ate", positiveMeasure},
        {"ator", "ate", positiveMeasure},
        {"alism", "al", positiveMeasure},
        {"iveness", "ive", positiveMeasure},
        {"fulness", "ful", positiveMeasure},
        {"ousness", "ous", positiveMeasure},
        {"aliti", "al", positiveMeasure},
        {"iviti", "ive", positiveMeasure},
        {"biliti", "ble", positiveMeasure},
        {"fulli", "ful", positiveMeasure},
        // the 'l' of LOGI is measured with the stem
        {"logi", "log", [](const std::string& stem) { return hasPositiveMeasure(stem + "l"); }},
    };
    return applyRuleList(word, rules);
}

std::string PorterStemmer::step3(const std::string& word) const {
    static const std::vector<SuffixRule> rules = {
        {"icate", "ic", positiveMeasure},
        {"ative", "", positiveMeasure},
        {"alize", "al", positiveMeasure},
        {"iciti", "ic", positiveMeasure},
        {"ical", "ic", positiveMeasure},
        {"ful", "", positiveMeasure},
        {"ness", "", positiveMeasure},
    };
    return applyRuleList(word, rules);
}

std::string PorterStemmer::step4(const std::string& word) const {
    static const std::vector<SuffixRule> rules = {
        {"al", "", measureAboveOne},
        {"ance", "", measureAboveOne},
        {"ence", "", measureAboveOne},
        {"er", "", measureAboveOne},
        {"ic", "", measureAboveOne},
        {"able", "", measureAboveOne},
        {"ible", "", measureAboveOne},
        {"ant", "", measureAboveOne},
        {"ement", "", measureAboveOne},
        {"ment", "", measureAboveOne},
        {"ent", "", measureAboveOne},
        {"ion", "",
         [](const std::string& stem) {
             return measure(stem) > 1 && !stem.empty() && (stem.back() == 's' || stem.back() == 't');
         }},
        {"ou", "", measureAboveOne},
        {"ism", "", measureAboveOne},
        {"ate", "", measureAboveOne},
        {"iti", "", measureAboveOne},
        {"ous", "", measureAboveOne},
        {"ive", "", measureAboveOne},
        {"ize", "", measureAboveOne},
    };
    return applyRuleList(word, rules);
}

std::string PorterStemmer::step5a(const std::string& word) const {
    if (endsWith(word, "e")) {
        std::string stem = dropSuffix(word, 1);
        int m = measure(stem);
        if (m > 1) return stem;
        if (m == 1 && !endsCVC(stem)) return stem;
    }
    return word;
}

std::string PorterStemmer::step5b(const std::string& word) const {
    static const std::vector<SuffixRule> rules = {
        {"ll", "l", [](const std::string& stem) { return measure(stem + "l") > 1; }},
    };
    return applyRuleList(word, rules);
}

std::string PorterStemmer::stem(const std::string& input_word) const {
    std::string word = input_word;
    for (char& c : word) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    const auto& pool = irregularForms();
    if (auto it = pool.find(word); it != pool.end()) {
        if (trace) trace("irregular", word, it->second);
        return it->second;
    }

    if (word.size() <= 2) return word;

    using Step = std::string (PorterStemmer::*)(const std::string&) const;
    static const std::pair<std::string_view, Step> steps[] = {
        {"1a", &PorterStemmer::step1a}, {"1b", &PorterStemmer::step1b}, {"1c", &PorterStemmer::step1c},
        {"2", &PorterStemmer::step2},   {"3", &PorterStemmer::step3},   {"4", &PorterStemmer::step4},
        {"5a", &PorterStemmer::step5a}, {"5b", &PorterStemmer::step5b},
    };

    for (const auto& [name, step] : steps) {
        std::string next = (this->*step)(word);
        if (trace && next != word) trace(name, word, next);
        word = std::move(next);
    }

    return word;
}

std::string DummyStemmer::stem(const std::string& word) const { return word; }
