#pragma once

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "model.h"
#include "tokenizer.h"

double l2Norm(std::span<const double> values);
size_t nonZeroAmount(std::span<const double> values);

// Raw term counts times IDF, then L2 normalized. Terms outside the vocabulary are ignored.
class TFIDFVectorizer {
private:
    std::shared_ptr<const ModelBundle> model;
    std::shared_ptr<const Tokenizer> tokenizer;

public:
    TFIDFVectorizer(std::shared_ptr<const ModelBundle> model, std::shared_ptr<const Tokenizer> tok);

    std::vector<double> transform(std::string_view text) const;
    std::vector<double> transformTokens(const std::vector<std::string>& tokens) const;

    size_t dimension() const { return model->size(); }
};
