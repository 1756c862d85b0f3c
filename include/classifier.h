#pragma once

#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "model.h"

struct Prediction {
    int label;               // 1 = likely fake, 0 = likely reliable
    double probability;      // P(label == 1)
    double confidence;       // max(probability, 1 - probability)
    double fakeProbability;
    double realProbability;
};

// One term's share of the decision score: value * coefficient.
struct FeatureContribution {
    size_t index;
    double value;
    double coefficient;
    double contribution;
};

enum class Verdict { Uncertain, LikelyFake, LikelyReliable };

double sigmoid(double score);

Verdict verdictOf(const Prediction& prediction, double uncertainty_threshold = 0.6);
std::string_view verdictName(Verdict verdict);

class LogisticClassifier {
private:
    std::shared_ptr<const ModelBundle> model;

public:
    explicit LogisticClassifier(std::shared_ptr<const ModelBundle> model);

    double score(std::span<const double> features) const;
    Prediction predict(std::span<const double> features) const;
    // Non-zero features only, in vocabulary order. Sums to score(features) - intercept.
    std::vector<FeatureContribution> contributions(std::span<const double> features) const;
};
