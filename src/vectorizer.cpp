#include "vectorizer.h"

#include <cmath>
#include <unordered_map>

double l2Norm(std::span<const double> values) {
    double sum_squares = 0.0;
    for (double v : values) sum_squares += v * v;
    return std::sqrt(sum_squares);
}

size_t nonZeroAmount(std::span<const double> values) {
    size_t amount = 0;
    for (double v : values) {
        if (v != 0.0) ++amount;
    }
    return amount;
}

TFIDFVectorizer::TFIDFVectorizer(std::shared_ptr<const ModelBundle> m, std::shared_ptr<const Tokenizer> tok)
    : model(std::move(m)), tokenizer(tok ? std::move(tok) : std::make_shared<const Tokenizer>()) {
    if (!model) throw InvalidModelBundle("vectorizer needs a model");
}

std::vector<double> TFIDFVectorizer::transform(std::string_view text) const {
    return transformTokens(tokenizer->normalize(text));
}

std::vector<double> TFIDFVectorizer::transformTokens(const std::vector<std::string>& tokens) const {
    // first-occurrence order is kept so the sum of squares accumulates like the exporter's
    std::unordered_map<std::string_view, uint32_t> local_counts;
    std::vector<std::string_view> order;
    for (const std::string& token : tokens) {
        uint32_t& tf = local_counts[token];
        if (tf == 0) order.push_back(token);
        ++tf;
    }

    std::vector<double> features(model->size(), 0.0);
    double sum_squares = 0.0;

    for (std::string_view term : order) {
        auto idx = model->indexOf(term);
        if (!idx) continue;

        double value = local_counts[term] * model->idf[*idx];
        features[*idx] = value;
        sum_squares += value * value;
    }

    if (sum_squares > 0) {
        double norm = std::sqrt(sum_squares);
        for (double& v : features) v /= norm;
    }

    return features;
}
