#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "classifier.h"
#include "model.h"
#include "tokenizer.h"
#include "vectorizer.h"

std::vector<std::string> normalize(std::string_view text);
std::vector<double> vectorize(std::string_view text, const std::shared_ptr<const ModelBundle>& model);
Prediction predict(std::span<const double> features, const std::shared_ptr<const ModelBundle>& model);

// text -> tokens -> tf-idf -> logistic regression. Holds no per-call state, so one instance can
// serve concurrent callers.
class NewsClassifier {
private:
    std::shared_ptr<const ModelBundle> bundle;
    std::shared_ptr<const Tokenizer> tokenizer;
    TFIDFVectorizer vectorizer;
    LogisticClassifier classifier;

public:
    explicit NewsClassifier(std::shared_ptr<const ModelBundle> model,
                            std::shared_ptr<const Tokenizer> tok = std::make_shared<const Tokenizer>());

    Prediction classify(std::string_view text) const;

    std::vector<std::string> normalize(std::string_view text) const { return tokenizer->normalize(text); }
    std::vector<double> vectorize(std::string_view text) const { return vectorizer.transform(text); }
    Prediction predict(std::span<const double> features) const { return classifier.predict(features); }

    const ModelBundle& model() const { return *bundle; }
    const LogisticClassifier& getClassifier() const { return classifier; }
};
