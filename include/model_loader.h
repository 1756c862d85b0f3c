#pragma once

#include <memory>
#include <string>

#include "model.h"

// Reads the exported parameters: {"vocabulary": [...], "idf_values": [...], "coefficients": [...], "intercept": x}
std::shared_ptr<const ModelBundle> loadModelFromJson(const std::string& json);

std::shared_ptr<const ModelBundle> loadModelFromFile(const std::string& path);
