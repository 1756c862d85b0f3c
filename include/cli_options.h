#pragma once

#include <string>

struct CliOptions {
    std::string model_path;
    std::string input_path = "-";
    bool html = false;
    bool any_page = false;
    bool trace = false;
    double threshold = 0.6;
    bool help = false;
    std::string help_text;
};

// Throws std::invalid_argument when the model path is missing or the threshold is outside [0.5, 1].
// Malformed options surface as cxxopts exceptions (std::exception).
CliOptions parseCliOptions(int argc, const char* const* argv);
