#include "model.h"

#include <cmath>
#include <string>

namespace {

void checkFinite(const std::vector<double>& values, const char* field) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (!std::isfinite(values[i])) {
            throw InvalidModelBundle(std::string(field) + "[" + std::to_string(i) + "] is not a finite number");
        }
    }
}

}  // namespace

ModelBundle::ModelBundle(std::vector<std::string> vocab, std::vector<double> idf_values,
                         std::vector<double> coefs, double bias)
    : vocabulary(std::move(vocab)), idf(std::move(idf_values)), coefficients(std::move(coefs)), intercept(bias) {
    if (vocabulary.empty()) {
        throw InvalidModelBundle("empty vocabulary");
    }
    if (idf.size() != vocabulary.size()) {
        throw InvalidModelBundle("idf has " + std::to_string(idf.size()) + " values for " +
                                 std::to_string(vocabulary.size()) + " terms");
    }
    if (coefficients.size() != vocabulary.size()) {
        throw InvalidModelBundle("coefficients has " + std::to_string(coefficients.size()) + " values for " +
                                 std::to_string(vocabulary.size()) + " terms");
    }
    checkFinite(idf, "idf");
    checkFinite(coefficients, "coefficients");
    if (!std::isfinite(intercept)) {
        throw InvalidModelBundle("intercept is not a finite number");
    }

    term_index.reserve(vocabulary.size());
    for (size_t i = 0; i < vocabulary.size(); ++i) {
        if (!term_index.emplace(vocabulary[i], static_cast<uint32_t>(i)).second) {
            throw InvalidModelBundle("duplicate vocabulary term '" + vocabulary[i] + "'");
        }
    }
}

std::shared_ptr<const ModelBundle> ModelBundle::create(std::vector<std::string> vocabulary, std::vector<double> idf,
                                                       std::vector<double> coefficients, double intercept) {
    return std::shared_ptr<const ModelBundle>(
        new ModelBundle(std::move(vocabulary), std::move(idf), std::move(coefficients), intercept));
}

std::optional<size_t> ModelBundle::indexOf(std::string_view term) const {
    auto it = term_index.find(term);
    if (it == term_index.end()) return std::nullopt;
    return it->second;
}
