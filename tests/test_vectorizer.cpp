#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "vectorizer.h"

class VectorizerTest : public ::testing::Test {
protected:
    std::shared_ptr<const ModelBundle> model =
        ModelBundle::create({"report", "fake", "breaking"}, {1.0, 2.0, 1.5}, {0.5, -1.2, 0.3}, 0.1);
    TFIDFVectorizer vectorizer{model, std::make_shared<const Tokenizer>()};
};

TEST_F(VectorizerTest, OutputLengthIsVocabularySize) {
    EXPECT_EQ(vectorizer.transform("anything at all").size(), 3u);
    EXPECT_EQ(vectorizer.transform("").size(), 3u);
    EXPECT_EQ(vectorizer.dimension(), 3u);
}

TEST_F(VectorizerTest, RawCountTimesIdfThenL2) {
    auto features = vectorizer.transform("Breaking: this report is fake fake fake.");

    const double norm = std::sqrt(1.0 + 36.0);
    ASSERT_EQ(features.size(), 3u);
    EXPECT_NEAR(features[0], 1.0 / norm, 1e-12);
    EXPECT_NEAR(features[1], 6.0 / norm, 1e-12);
    EXPECT_DOUBLE_EQ(features[2], 0.0);
    EXPECT_NEAR(features[0], 0.1643989873053573, 1e-12);
    EXPECT_NEAR(features[1], 0.9863939238321437, 1e-12);
}

TEST_F(VectorizerTest, EmptyTextGivesZeroVector) {
    auto features = vectorizer.transform("");

    EXPECT_EQ(features, std::vector<double>(3, 0.0));
    EXPECT_DOUBLE_EQ(l2Norm(features), 0.0);
}

TEST_F(VectorizerTest, OutOfVocabularyOnlyGivesZeroVector) {
    auto features = vectorizer.transform("Completely unrelated words about weather and cooking");

    EXPECT_EQ(features, std::vector<double>(3, 0.0));
    EXPECT_EQ(nonZeroAmount(features), 0u);
}

TEST_F(VectorizerTest, SingleTermIsUnitVector) {
    auto features = vectorizer.transform("fake");

    EXPECT_DOUBLE_EQ(features[0], 0.0);
    EXPECT_DOUBLE_EQ(features[1], 1.0);
    EXPECT_DOUBLE_EQ(features[2], 0.0);
}

TEST_F(VectorizerTest, NormIsZeroOrOne) {
    const std::vector<std::string> texts = {
        "",
        "the and of",
        "report",
        "FAKE report, fake report!",
        "Reports reporting reported fakes faking",
        "Nothing relevant here",
        "fake fake fake fake fake fake fake fake fake fake report",
    };

    for (const auto& text : texts) {
        auto features = vectorizer.transform(text);
        double norm = l2Norm(features);
        if (nonZeroAmount(features) == 0) {
            EXPECT_DOUBLE_EQ(norm, 0.0) << text;
        } else {
            EXPECT_NEAR(norm, 1.0, 1e-12) << text;
        }
    }
}

TEST_F(VectorizerTest, TransformTokensSkipsNormalization) {
    auto features = vectorizer.transformTokens({"breaking", "breaking", "report"});

    const double norm = std::sqrt(9.0 + 1.0);
    EXPECT_NEAR(features[0], 1.0 / norm, 1e-12);
    EXPECT_DOUBLE_EQ(features[1], 0.0);
    EXPECT_NEAR(features[2], 3.0 / norm, 1e-12);
}

TEST_F(VectorizerTest, StemmedSurfaceFormsShareFeature) {
    auto a = vectorizer.transform("reports");
    auto b = vectorizer.transform("reporting");

    EXPECT_EQ(a, b);
    EXPECT_DOUBLE_EQ(a[0], 1.0);
}

TEST(VectorizerConstructionTest, NullModelRejected) {
    EXPECT_THROW(TFIDFVectorizer(nullptr, std::make_shared<const Tokenizer>()), InvalidModelBundle);
}

TEST(VectorizerConstructionTest, NullTokenizerFallsBackToPorter) {
    auto model = ModelBundle::create({"run"}, {1.0}, {1.0}, 0.0);
    TFIDFVectorizer vectorizer(model, nullptr);

    EXPECT_DOUBLE_EQ(vectorizer.transform("running")[0], 1.0);
}

TEST(VectorNormTest, Helpers) {
    std::vector<double> v = {3.0, 0.0, 4.0};
    EXPECT_DOUBLE_EQ(l2Norm(v), 5.0);
    EXPECT_EQ(nonZeroAmount(v), 2u);
}
