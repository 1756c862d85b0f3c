#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "string_hash.h"

class InvalidModelBundle : public std::runtime_error {
public:
    explicit InvalidModelBundle(const std::string& what) : std::runtime_error("invalid model bundle: " + what) {}
};

// Vocabulary, IDF weights and logistic regression parameters exported by the training side.
// Position in the vocabulary is the feature index shared by idf and coefficients.
// Built once, then only read.
class ModelBundle {
private:
    std::unordered_map<std::string, uint32_t, StringHash, std::equal_to<>> term_index;

    ModelBundle(std::vector<std::string> vocabulary, std::vector<double> idf, std::vector<double> coefficients,
                double intercept);

public:
    const std::vector<std::string> vocabulary;
    const std::vector<double> idf;
    const std::vector<double> coefficients;
    const double intercept;

    static std::shared_ptr<const ModelBundle> create(std::vector<std::string> vocabulary, std::vector<double> idf,
                                                     std::vector<double> coefficients, double intercept);

    std::optional<size_t> indexOf(std::string_view term) const;
    size_t size() const { return vocabulary.size(); }
};
