#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "cli_options.h"
#include "model_loader.h"
#include "pipeline.h"
#include "stopwords.h"
#include "text_extractor.h"

namespace {

std::string readInput(const std::string& path) {
    std::ostringstream buffer;
    if (path.empty() || path == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open input file: " + path);
    buffer << in.rdbuf();
    return buffer.str();
}

void traceText(const std::string& text, const NewsClassifier& news_classifier) {
    Tokenizer tokenizer;
    tokenizer.tokenize(text);
    const auto& tokens = tokenizer.getTokens();

    std::clog << "Original text length: " << text.size() << " chars\n";
    std::clog << "Split: " << tokenizer.rawTokensAmount() << " words\n";
    std::clog << "After stopword removal: " << tokenizer.tokensAmount() << " words (removed: "
              << tokenizer.stopwordsRemoved() << ", stopword list: " << stopwordsAmount() << ")\n";
    std::clog << "Average stem length: " << tokenizer.avgTokenLen() << "\n";

    std::clog << "First 20 processed words:";
    for (size_t i = 0; i < tokens.size() && i < 20; ++i) std::clog << ' ' << tokens[i];
    std::clog << "\n";

    PorterStemmer stemmer;
    stemmer.setTraceHook([](std::string_view step, const std::string& before, const std::string& after) {
        std::clog << "    [" << step << "] " << before << " -> " << after << "\n";
    });
    auto words = Tokenizer::splitWords(text);
    size_t traced = 0;
    for (const auto& word : words) {
        if (traced == 5) break;
        if (isStopword(word)) continue;
        std::clog << "  " << word << " -> " << stemmer.stem(word) << "\n";
        ++traced;
    }

    auto features = news_classifier.vectorize(text);
    std::clog << "Vocabulary size: " << news_classifier.model().size() << "\n";
    std::clog << "Non-zero features: " << nonZeroAmount(features) << "\n";

    const LogisticClassifier& classifier = news_classifier.getClassifier();
    auto parts = classifier.contributions(features);
    std::stable_sort(parts.begin(), parts.end(), [](const auto& a, const auto& b) { return a.value > b.value; });

    std::clog << "Top features:\n";
    for (size_t i = 0; i < parts.size() && i < 20; ++i) {
        const auto& part = parts[i];
        std::clog << "  " << std::setw(20) << std::left << news_classifier.model().vocabulary[part.index] << std::right
                  << " | TF-IDF: " << std::fixed << std::setprecision(8) << part.value << " | Coef: " << std::showpos
                  << std::setprecision(4) << part.coefficient << " | Contrib: " << std::setprecision(6)
                  << part.contribution << std::noshowpos << "\n";
    }

    double total = 0;
    for (const auto& part : parts) total += part.contribution;
    double score = classifier.score(features);
    Prediction prediction = classifier.predict(features);

    std::clog << std::setprecision(6);
    std::clog << "Prediction breakdown:\n";
    std::clog << "  Intercept: " << news_classifier.model().intercept << "\n";
    std::clog << "  Total feature contribution: " << total << "\n";
    std::clog << "  Raw score: " << score << "\n";
    std::clog << "  Probability real: " << prediction.realProbability << " (" << std::setprecision(2)
              << prediction.realProbability * 100 << "%)\n";
    std::clog << std::setprecision(6) << "  Probability fake: " << prediction.fakeProbability << " ("
              << std::setprecision(2) << prediction.fakeProbability * 100 << "%)\n";
    std::clog << "  Final prediction: " << (prediction.label == 1 ? "FAKE" : "REAL") << "\n";
    std::clog.unsetf(std::ios::floatfield);
    std::clog << std::setprecision(6);
}

}  // namespace

int main(int argc, char** argv) {
    CliOptions options;
    try {
        options = parseCliOptions(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n" << "Usage: veracity MODEL_JSON [INPUT_FILE] [--html] [--trace] [--threshold x]\n";
        return 1;
    }
    if (options.help) {
        std::cout << options.help_text << "\n";
        return 0;
    }

    std::shared_ptr<const ModelBundle> model;
    try {
        model = loadModelFromFile(options.model_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load model from " << options.model_path << ": " << e.what() << "\n";
        return 1;
    }
    std::clog << "Loaded model: " << model->size() << " terms\n";

    std::string text;
    try {
        text = readInput(options.input_path);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    if (options.html) {
        PageText page = extractPageText(text);
        if (!page.article_markup && !options.any_page) {
            std::cout << "This doesn't appear to be a news article\n";
            return 2;
        }
        if (page.tooShort()) {
            std::clog << "Warning: extracted text is only " << page.text.size() << " chars, extraction may have failed\n";
        }
        text = std::move(page.text);
    }

    NewsClassifier news_classifier(model);
    if (options.trace) traceText(text, news_classifier);

    Prediction prediction = news_classifier.classify(text);
    Verdict verdict = verdictOf(prediction, options.threshold);

    std::cout << std::fixed << std::setprecision(1);
    std::cout << verdictName(verdict) << "\n";
    std::cout << "Confidence: " << prediction.confidence * 100 << "%\n";
    std::cout << "Real: " << prediction.realProbability * 100 << "%  Fake: " << prediction.fakeProbability * 100
              << "%\n";
    return 0;
}
