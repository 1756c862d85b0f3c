#include "pipeline.h"

namespace {

const std::shared_ptr<const Tokenizer>& defaultTokenizer() {
    static const std::shared_ptr<const Tokenizer> tokenizer = std::make_shared<const Tokenizer>();
    return tokenizer;
}

}  // namespace

std::vector<std::string> normalize(std::string_view text) { return defaultTokenizer()->normalize(text); }

std::vector<double> vectorize(std::string_view text, const std::shared_ptr<const ModelBundle>& model) {
    return TFIDFVectorizer(model, defaultTokenizer()).transform(text);
}

Prediction predict(std::span<const double> features, const std::shared_ptr<const ModelBundle>& model) {
    return LogisticClassifier(model).predict(features);
}

NewsClassifier::NewsClassifier(std::shared_ptr<const ModelBundle> model, std::shared_ptr<const Tokenizer> tok)
    : bundle(model), tokenizer(tok ? std::move(tok) : defaultTokenizer()), vectorizer(model, tokenizer),
      classifier(model) {}

Prediction NewsClassifier::classify(std::string_view text) const { return classifier.predict(vectorizer.transform(text)); }
