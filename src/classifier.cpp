#include "classifier.h"

#include <cmath>
#include <stdexcept>
#include <string>

double sigmoid(double score) { return 1.0 / (1.0 + std::exp(-score)); }

Verdict verdictOf(const Prediction& prediction, double uncertainty_threshold) {
    if (prediction.confidence < uncertainty_threshold) return Verdict::Uncertain;
    return prediction.label == 1 ? Verdict::LikelyFake : Verdict::LikelyReliable;
}

std::string_view verdictName(Verdict verdict) {
    switch (verdict) {
        case Verdict::Uncertain:
            return "Uncertain";
        case Verdict::LikelyFake:
            return "Likely Fake News";
        case Verdict::LikelyReliable:
            return "Likely Reliable";
    }
    return "Uncertain";
}

LogisticClassifier::LogisticClassifier(std::shared_ptr<const ModelBundle> m) : model(std::move(m)) {
    if (!model) throw InvalidModelBundle("classifier needs a model");
}

namespace {

void checkLength(std::span<const double> features, const ModelBundle& model) {
    if (features.size() != model.coefficients.size()) {
        throw std::invalid_argument("feature vector has " + std::to_string(features.size()) + " values, model expects " +
                                    std::to_string(model.coefficients.size()));
    }
}

}  // namespace

double LogisticClassifier::score(std::span<const double> features) const {
    checkLength(features, *model);

    double score = model->intercept;
    for (size_t i = 0; i < features.size(); ++i) {
        score += features[i] * model->coefficients[i];
    }
    return score;
}

Prediction LogisticClassifier::predict(std::span<const double> features) const {
    double probability = sigmoid(score(features));

    Prediction prediction;
    prediction.label = probability > 0.5 ? 1 : 0;
    prediction.probability = probability;
    prediction.confidence = probability > 0.5 ? probability : 1 - probability;
    prediction.fakeProbability = probability;
    prediction.realProbability = 1 - probability;
    return prediction;
}

std::vector<FeatureContribution> LogisticClassifier::contributions(std::span<const double> features) const {
    checkLength(features, *model);

    std::vector<FeatureContribution> result;
    for (size_t i = 0; i < features.size(); ++i) {
        if (features[i] == 0.0) continue;
        result.push_back({i, features[i], model->coefficients[i], features[i] * model->coefficients[i]});
    }
    return result;
}
