#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "classifier.h"

class ClassifierTest : public ::testing::Test {
protected:
    std::shared_ptr<const ModelBundle> model =
        ModelBundle::create({"report", "fake", "breaking"}, {1.0, 2.0, 1.5}, {0.5, -1.2, 0.3}, 0.1);
    LogisticClassifier classifier{model};
};

TEST_F(ClassifierTest, ScoreIsInterceptPlusDotProduct) {
    std::vector<double> features = {1.0, 2.0, 3.0};
    EXPECT_NEAR(classifier.score(features), 0.1 + 0.5 - 2.4 + 0.9, 1e-12);
}

TEST_F(ClassifierTest, ReferenceFeatureVector) {
    std::vector<double> features = {0.1643989873053573, 0.9863939238321437, 0.0};

    Prediction p = classifier.predict(features);

    EXPECT_EQ(p.label, 0);
    EXPECT_NEAR(p.probability, 0.2686518683473176, 1e-12);
    EXPECT_NEAR(p.confidence, 0.7313481316526824, 1e-12);
    EXPECT_DOUBLE_EQ(p.fakeProbability, p.probability);
    EXPECT_DOUBLE_EQ(p.realProbability, 1 - p.probability);
}

TEST_F(ClassifierTest, ZeroVectorGivesSigmoidOfIntercept) {
    std::vector<double> features(3, 0.0);

    Prediction p = classifier.predict(features);

    EXPECT_DOUBLE_EQ(p.probability, sigmoid(0.1));
    EXPECT_NEAR(p.probability, 0.52497918747894, 1e-12);
    EXPECT_EQ(p.label, 1);
}

TEST_F(ClassifierTest, WrongFeatureLengthThrows) {
    std::vector<double> too_short = {1.0, 2.0};
    std::vector<double> too_long = {1.0, 2.0, 3.0, 4.0};

    EXPECT_THROW(classifier.predict(too_short), std::invalid_argument);
    EXPECT_THROW(classifier.score(too_long), std::invalid_argument);
}

TEST_F(ClassifierTest, ContributionsSumToScoreMinusIntercept) {
    std::vector<double> features = {0.1643989873053573, 0.9863939238321437, 0.0};

    auto parts = classifier.contributions(features);

    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].index, 0u);
    EXPECT_DOUBLE_EQ(parts[0].coefficient, 0.5);
    EXPECT_DOUBLE_EQ(parts[0].contribution, 0.1643989873053573 * 0.5);
    EXPECT_EQ(parts[1].index, 1u);
    EXPECT_DOUBLE_EQ(parts[1].value, 0.9863939238321437);
    EXPECT_DOUBLE_EQ(parts[1].contribution, 0.9863939238321437 * -1.2);

    double total = 0;
    for (const auto& part : parts) total += part.contribution;
    EXPECT_NEAR(total, classifier.score(features) - model->intercept, 1e-12);
}

TEST_F(ClassifierTest, ContributionsOfZeroVectorAreEmpty) {
    std::vector<double> features(3, 0.0);
    std::vector<double> too_short = {1.0};

    EXPECT_TRUE(classifier.contributions(features).empty());
    EXPECT_THROW(classifier.contributions(too_short), std::invalid_argument);
}

TEST(SigmoidTest, MonotonicAndBounded) {
    double previous = sigmoid(-30.0);
    EXPECT_GT(previous, 0.0);
    for (double score = -29.5; score <= 30.0; score += 0.5) {
        double p = sigmoid(score);
        EXPECT_GT(p, previous) << score;
        EXPECT_GT(p, 0.0);
        EXPECT_LT(p, 1.0);
        previous = p;
    }
    EXPECT_DOUBLE_EQ(sigmoid(0.0), 0.5);
}

TEST(LabelBoundaryTest, FlipsAboveOneHalf) {
    auto model = ModelBundle::create({"x"}, {1.0}, {1.0}, 0.0);
    LogisticClassifier classifier(model);

    std::vector<double> at_boundary = {0.0};
    std::vector<double> above = {1e-9};
    std::vector<double> below = {-1e-9};

    Prediction p0 = classifier.predict(at_boundary);
    EXPECT_DOUBLE_EQ(p0.probability, 0.5);
    EXPECT_EQ(p0.label, 0);
    EXPECT_DOUBLE_EQ(p0.confidence, 0.5);

    EXPECT_EQ(classifier.predict(above).label, 1);
    EXPECT_EQ(classifier.predict(below).label, 0);
}

TEST(LabelBoundaryTest, ConfidenceIsMaxOfBothSides) {
    auto model = ModelBundle::create({"x"}, {1.0}, {1.0}, 0.0);
    LogisticClassifier classifier(model);

    for (double x : {-3.0, -0.2, 0.4, 2.5}) {
        std::vector<double> features = {x};
        Prediction p = classifier.predict(features);
        EXPECT_DOUBLE_EQ(p.confidence, std::max(p.probability, 1 - p.probability));
    }
}

TEST(VerdictTest, ThresholdAndLabel) {
    Prediction uncertain{1, 0.55, 0.55, 0.55, 0.45};
    Prediction fake{1, 0.9, 0.9, 0.9, 0.1};
    Prediction real{0, 0.2, 0.8, 0.2, 0.8};
    Prediction edge{0, 0.4, 0.6, 0.4, 0.6};

    EXPECT_EQ(verdictOf(uncertain), Verdict::Uncertain);
    EXPECT_EQ(verdictOf(fake), Verdict::LikelyFake);
    EXPECT_EQ(verdictOf(real), Verdict::LikelyReliable);
    EXPECT_EQ(verdictOf(edge), Verdict::LikelyReliable);
    EXPECT_EQ(verdictOf(uncertain, 0.5), Verdict::LikelyFake);
}

TEST(VerdictTest, Names) {
    EXPECT_EQ(verdictName(Verdict::Uncertain), "Uncertain");
    EXPECT_EQ(verdictName(Verdict::LikelyFake), "Likely Fake News");
    EXPECT_EQ(verdictName(Verdict::LikelyReliable), "Likely Reliable");
}

TEST(ClassifierConstructionTest, NullModelRejected) {
    EXPECT_THROW(LogisticClassifier(nullptr), InvalidModelBundle);
}
