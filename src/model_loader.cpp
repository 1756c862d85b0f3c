#include "model_loader.h"

#include <bsoncxx/array/view.hpp>
#include <bsoncxx/document/element.hpp>
#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>
#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/json.hpp>
#include <bsoncxx/types.hpp>
#include <bsoncxx/types/bson_value/view.hpp>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

bsoncxx::document::element requireField(const bsoncxx::document::view& doc, const char* field) {
    auto ele = doc[field];
    if (!ele) {
        throw InvalidModelBundle(std::string("missing field '") + field + "'");
    }
    return ele;
}

double readNumber(const bsoncxx::types::bson_value::view& value, const std::string& where) {
    switch (value.type()) {
        case bsoncxx::type::k_double:
            return value.get_double().value;
        case bsoncxx::type::k_int32:
            return value.get_int32().value;
        case bsoncxx::type::k_int64:
            return static_cast<double>(value.get_int64().value);
        default:
            throw InvalidModelBundle(where + " is not a number");
    }
}

bsoncxx::array::view requireArray(const bsoncxx::document::view& doc, const char* field) {
    auto ele = requireField(doc, field);
    if (ele.type() != bsoncxx::type::k_array) {
        throw InvalidModelBundle(std::string("field '") + field + "' is not an array");
    }
    return ele.get_array().value;
}

std::vector<double> readNumbers(const bsoncxx::document::view& doc, const char* field) {
    std::vector<double> values;
    size_t i = 0;
    for (auto&& item : requireArray(doc, field)) {
        values.push_back(readNumber(item.get_value(), std::string(field) + "[" + std::to_string(i) + "]"));
        ++i;
    }
    return values;
}

std::vector<std::string> readStrings(const bsoncxx::document::view& doc, const char* field) {
    std::vector<std::string> values;
    size_t i = 0;
    for (auto&& item : requireArray(doc, field)) {
        if (item.type() != bsoncxx::type::k_string) {
            throw InvalidModelBundle(std::string(field) + "[" + std::to_string(i) + "] is not a string");
        }
        values.emplace_back(item.get_string().value);
        ++i;
    }
    return values;
}

}  // namespace

std::shared_ptr<const ModelBundle> loadModelFromJson(const std::string& json) {
    std::optional<bsoncxx::document::value> parsed;
    try {
        parsed.emplace(bsoncxx::from_json(json));
    } catch (const bsoncxx::exception& e) {
        throw InvalidModelBundle(std::string("malformed JSON: ") + e.what());
    }

    bsoncxx::document::view doc = parsed->view();

    std::vector<std::string> vocabulary = readStrings(doc, "vocabulary");
    std::vector<double> idf = readNumbers(doc, "idf_values");
    std::vector<double> coefficients = readNumbers(doc, "coefficients");
    double intercept = readNumber(requireField(doc, "intercept").get_value(), "intercept");

    return ModelBundle::create(std::move(vocabulary), std::move(idf), std::move(coefficients), intercept);
}

std::shared_ptr<const ModelBundle> loadModelFromFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cannot open model file: " + path);

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw std::runtime_error("Cannot read model file: " + path);

    return loadModelFromJson(buffer.str());
}
