#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include "model.h"

TEST(ModelBundleTest, CreateValidBundle) {
    auto model = ModelBundle::create({"report", "fake", "breaking"}, {1.0, 2.0, 1.5}, {0.5, -1.2, 0.3}, 0.1);

    ASSERT_NE(model, nullptr);
    EXPECT_EQ(model->size(), 3u);
    EXPECT_DOUBLE_EQ(model->intercept, 0.1);
    EXPECT_EQ(model->vocabulary[2], "breaking");
    EXPECT_DOUBLE_EQ(model->idf[1], 2.0);
    EXPECT_DOUBLE_EQ(model->coefficients[1], -1.2);
}

TEST(ModelBundleTest, IndexFollowsVocabularyOrder) {
    auto model = ModelBundle::create({"report", "fake", "breaking"}, {1.0, 2.0, 1.5}, {0.5, -1.2, 0.3}, 0.1);

    EXPECT_EQ(model->indexOf("report"), 0u);
    EXPECT_EQ(model->indexOf("fake"), 1u);
    EXPECT_EQ(model->indexOf("breaking"), 2u);
    EXPECT_FALSE(model->indexOf("break").has_value());
    EXPECT_FALSE(model->indexOf("").has_value());
}

TEST(ModelBundleTest, RejectsEmptyVocabulary) {
    EXPECT_THROW(ModelBundle::create({}, {}, {}, 0.0), InvalidModelBundle);
}

TEST(ModelBundleTest, RejectsIdfLengthMismatch) {
    EXPECT_THROW(ModelBundle::create({"a", "b"}, {1.0}, {0.1, 0.2}, 0.0), InvalidModelBundle);
}

TEST(ModelBundleTest, RejectsCoefficientLengthMismatch) {
    EXPECT_THROW(ModelBundle::create({"a", "b"}, {1.0, 1.0}, {0.1, 0.2, 0.3}, 0.0), InvalidModelBundle);
}

TEST(ModelBundleTest, RejectsDuplicateTerms) {
    EXPECT_THROW(ModelBundle::create({"a", "b", "a"}, {1.0, 1.0, 1.0}, {0.1, 0.2, 0.3}, 0.0), InvalidModelBundle);
}

TEST(ModelBundleTest, RejectsNonFiniteValues) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_THROW(ModelBundle::create({"a"}, {nan}, {0.1}, 0.0), InvalidModelBundle);
    EXPECT_THROW(ModelBundle::create({"a"}, {1.0}, {inf}, 0.0), InvalidModelBundle);
    EXPECT_THROW(ModelBundle::create({"a"}, {1.0}, {0.1}, nan), InvalidModelBundle);
}

TEST(ModelBundleTest, ErrorIsRuntimeError) {
    try {
        ModelBundle::create({"a", "b"}, {1.0}, {0.1, 0.2}, 0.0);
        FAIL() << "expected InvalidModelBundle";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("idf"), std::string::npos);
    }
}
